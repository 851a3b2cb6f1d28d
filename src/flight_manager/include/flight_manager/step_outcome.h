#ifndef _FLIGHT_MANAGER_STEP_OUTCOME_H
#define _FLIGHT_MANAGER_STEP_OUTCOME_H

#include <string>

namespace traj_tracking {

// 控制循环内单个可失败步骤的结果，飞行中的错误不以异常形式逃出循环
struct StepOutcome {
    bool ok = true;
    std::string error;

    static StepOutcome success() { return StepOutcome(); }
    static StepOutcome failure(const std::string& msg) {
        StepOutcome out;
        out.ok = false;
        out.error = msg;
        return out;
    }
};

// 每个调用点显式选择的失败处理策略
enum class FailurePolicy {
    IGNORE_AND_CONTINUE,  // 输入设备、可视化、记录
    ABORT_TO_LANDING      // 插值等影响飞行安全的步骤
};

}  // namespace traj_tracking

#endif
