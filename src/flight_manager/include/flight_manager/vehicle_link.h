#ifndef _FLIGHT_MANAGER_VEHICLE_LINK_H
#define _FLIGHT_MANAGER_VEHICLE_LINK_H

#include <traj_tracking/flight_data.h>
#include <Eigen/Dense>
#include <boost/optional.hpp>
#include <string>

namespace traj_tracking {

/**
 * @brief 外部飞控服务接口
 * 提供当前位姿（可能不可用）、位置指令、原地降落指令和安全判断。
 * 本模块不关心位姿如何获得、指令如何执行。
 */
class VehicleLink {
   public:
    virtual ~VehicleLink() {}

    // 最新位姿快照，不阻塞；未收到或已过期时为空
    virtual boost::optional<VehiclePose> pose() const = 0;
    virtual void sendPositionSetpoint(const Eigen::Vector3d& target) = 0;
    virtual void landInPlace() = 0;
    virtual bool isSafe() const = 0;
    virtual std::string name() const = 0;
};

}  // namespace traj_tracking

#endif
