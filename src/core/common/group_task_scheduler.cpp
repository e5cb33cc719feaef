#include "sec_subledger/core/group_task_scheduler.h"

#include <algorithm>

namespace sec_subledger {

GroupTaskScheduler::GroupTaskScheduler(int max_concurrent) {
    max_concurrent_ = std::max(1, max_concurrent);
}

}  // namespace sec_subledger
