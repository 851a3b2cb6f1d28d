#include <flight_manager/flight_manager.h>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>
#include <pcl_conversions/pcl_conversions.h>
#include <algorithm>
#include <stdexcept>

namespace traj_tracking {

FlightManager::FlightManager(ros::NodeHandle& nh, FlightMode mode) : nh_(nh), mode_(mode) {
    // 1) 读取参数并检查配置
    readParams();

    // 2) 加载参考轨迹，起飞前的所有错误在这里抛出
    loadReferences();

    // 3) 每架飞机一个飞控服务连接
    for (size_t i = 0; i < vehicle_names_.size(); i++) {
        links_.push_back(std::make_shared<RosVehicleLink>(nh_global_, vehicle_names_[i], odom_timeout_, odom_lost_timeout_, yaw_));
    }

    // 4) 输入设备与状态机
    createInput();
    if (mode_ == FlightMode::TRACKING) {
        std::vector<TrajectoryInterpolator> interps;
        for (size_t i = 0; i < references_.size(); i++) interps.push_back(TrajectoryInterpolator(references_[i]));
        controller_.reset(new FlightPhaseController(links_, interps, region_, fsm_params_, input_));
    } else {
        controller_.reset(new FlightPhaseController(links_, region_, fsm_params_, input_));
    }

    // 5) 外部中止与可视化
    abort_sub_ = nh_.subscribe("abort", 1, &FlightManager::rcvAbortCallback, this);
    ref_cloud_pub_ = nh_.advertise<sensor_msgs::PointCloud2>("reference_path", 1, true);
    desired_pub_ = nh_.advertise<visualization_msgs::Marker>("desired_pos_vis", 1);

    _vis_desired.header.frame_id = "world";
    _vis_desired.ns = "desired_pos";
    _vis_desired.id = 0;
    _vis_desired.type = visualization_msgs::Marker::SPHERE_LIST;
    _vis_desired.action = visualization_msgs::Marker::ADD;
    _vis_desired.scale.x = 0.1;
    _vis_desired.scale.y = 0.1;
    _vis_desired.scale.z = 0.1;
    _vis_desired.pose.orientation.w = 1.0;
    _vis_desired.color.r = 1.0;
    _vis_desired.color.g = 0.0;
    _vis_desired.color.b = 1.0;
    _vis_desired.color.a = 1.0;
}

void FlightManager::readParams() {
    nh_.param("vehicles", vehicle_names_, std::vector<std::string>(1, "cf1"));
    nh_.param("trajectory_files", trajectory_files_, std::vector<std::string>());
    nh_.param("flight_time", flight_time_, -1.0);
    nh_.param("speed_limit", constraint_.speed_limit, 1.0);
    nh_.param("safety_margin", constraint_.safety_margin, 0.8);
    nh_.param("auto_adjust", auto_adjust_, false);

    nh_.param("region/x_min", region_.x_min, -2.4);
    nh_.param("region/x_max", region_.x_max, 2.4);
    nh_.param("region/y_min", region_.y_min, -1.8);
    nh_.param("region/y_max", region_.y_max, 1.6);

    nh_.param("save_flag", save_flag_, false);
    nh_.param("save_dir", save_dir_, std::string("traj/out"));
    nh_.param("control_rate", control_rate_, 100.0);
    nh_.param("odom_timeout", odom_timeout_, 0.5);
    nh_.param("odom_lost_timeout", odom_lost_timeout_, 1.0);
    nh_.param("yaw", yaw_, 0.0);

    nh_.param("fsm/takeoff_timeout", fsm_params_.takeoff_timeout, 12.0);
    nh_.param("fsm/takeoff_altitude", fsm_params_.takeoff_altitude, 0.4);
    nh_.param("fsm/hover_height", fsm_params_.hover_height, 1.0);
    nh_.param("fsm/min_hover_time", fsm_params_.min_hover_time, 2.0);
    nh_.param("fsm/stable_tolerance", fsm_params_.stable_tolerance, 0.30);
    nh_.param("fsm/stabilize_timeout", fsm_params_.stabilize_timeout, 10.0);
    nh_.param("fsm/landing_altitude", fsm_params_.landing_altitude, 0.1);
    nh_.param("fsm/landing_timeout", fsm_params_.landing_timeout, 5.0);

    nh_.param("teleop/input_device", input_device_, std::string("keyboard"));
    nh_.param("teleop/joy_topic", joy_topic_, std::string("/joy"));
    nh_.param("teleop/key_hold_time", key_hold_time_, 0.15);
    nh_.param("teleop/deadzone", joy_deadzone_, 0.2);
    nh_.param("teleop/teleop_step", fsm_params_.teleop_step, 0.002);
    nh_.param("teleop/climb_step", fsm_params_.climb_step, 0.002);
    nh_.param("teleop/min_altitude", fsm_params_.min_altitude, 0.3);
    nh_.param("teleop/max_altitude", fsm_params_.max_altitude, 1.5);
    nh_.param("teleop/max_flight_time", fsm_params_.max_flight_time, 100.0);

    if (vehicle_names_.empty())
        throw std::invalid_argument("parameter 'vehicles' is empty");
    if (!isValidRegion(region_))
        throw std::invalid_argument("safety region has min > max");
    if (constraint_.speed_limit <= 0)
        throw std::invalid_argument("speed_limit must be positive");
    if (constraint_.safety_margin <= 0 || constraint_.safety_margin > 1)
        throw std::invalid_argument("safety_margin must be in (0, 1]");
    if (control_rate_ <= 0)
        throw std::invalid_argument("control_rate must be positive");
    if (fsm_params_.min_altitude > fsm_params_.max_altitude)
        throw std::invalid_argument("teleop/min_altitude exceeds teleop/max_altitude");
    if (mode_ == FlightMode::TRACKING && trajectory_files_.empty())
        throw std::invalid_argument("parameter 'trajectory_files' is required in tracking mode");
    if (!trajectory_files_.empty() && trajectory_files_.size() != 1 && trajectory_files_.size() != vehicle_names_.size())
        throw std::invalid_argument("'trajectory_files' must hold one file or one per vehicle");

    ROS_INFO("[flight_manager] %zu vehicle(s), control rate %.0f Hz, region X(%.2f, %.2f) Y(%.2f, %.2f)", vehicle_names_.size(),
             control_rate_, region_.x_min, region_.x_max, region_.y_min, region_.y_max);
}

void FlightManager::loadReferences() {
    if (trajectory_files_.empty())
        return;
    boost::optional<double> target;
    if (flight_time_ > 0)
        target = flight_time_;

    // 共用一条轨迹时只加载一次
    std::vector<std::shared_ptr<const Trajectory>> loaded;
    for (size_t i = 0; i < trajectory_files_.size(); i++) {
        Trajectory ref = TrajectoryStore::buildReference(trajectory_files_[i], target, constraint_, auto_adjust_);
        requireTrajectoryWithin(ref, region_);
        ROS_INFO("[flight_manager] reference: %d points, %.2f s, %.2f m", ref.size(), ref.duration(), ref.pathLength());
        loaded.push_back(std::make_shared<const Trajectory>(ref));
    }
    for (size_t i = 0; i < vehicle_names_.size(); i++) references_.push_back(loaded.size() == 1 ? loaded[0] : loaded[i]);
}

void FlightManager::createInput() {
    if (input_device_ == "joystick") {
        input_ = std::make_shared<JoystickInput>(nh_global_, joy_topic_, joy_deadzone_);
    } else if (input_device_ == "keyboard") {
        input_ = std::make_shared<KeyboardInput>(key_hold_time_);
    } else {
        throw std::invalid_argument("unknown teleop/input_device '" + input_device_ + "'");
    }
}

void FlightManager::rcvAbortCallback(const std_msgs::Empty::ConstPtr& /*msg*/) {
    ROS_WARN("[flight_manager] external abort received");
    controller_->requestStop();
}

void FlightManager::publishReferences() {
    // 参考轨迹以点云形式发布（latched），每条轨迹只发布一次
    pcl::PointCloud<pcl::PointXYZ> traj_pts_pcd;
    std::vector<const Trajectory*> published;
    for (size_t i = 0; i < references_.size(); i++) {
        const Trajectory* traj = references_[i].get();
        if (std::find(published.begin(), published.end(), traj) != published.end())
            continue;
        published.push_back(traj);
        for (int k = 0; k < traj->size(); k++) {
            Eigen::Vector3d p = traj->position(k);
            traj_pts_pcd.points.push_back(pcl::PointXYZ(p(0), p(1), p(2)));
        }
    }
    traj_pts_pcd.width = traj_pts_pcd.points.size();
    traj_pts_pcd.height = 1;
    traj_pts_pcd.is_dense = true;

    sensor_msgs::PointCloud2 traj_pts;
    pcl::toROSMsg(traj_pts_pcd, traj_pts);
    traj_pts.header.frame_id = "world";
    traj_pts.header.stamp = ros::Time::now();
    ref_cloud_pub_.publish(traj_pts);
}

StepOutcome FlightManager::publishDesired() {
    try {
        _vis_desired.header.stamp = ros::Time::now();
        _vis_desired.points.clear();
        for (size_t i = 0; i < controller_->vehicleCount(); i++) {
            if (!controller_->hasTarget(i))
                continue;
            geometry_msgs::Point pt;
            pt.x = controller_->target(i)(0);
            pt.y = controller_->target(i)(1);
            pt.z = controller_->target(i)(2);
            _vis_desired.points.push_back(pt);
        }
        desired_pub_.publish(_vis_desired);
    } catch (const ros::Exception& e) {
        return StepOutcome::failure(std::string("visualization failed: ") + e.what());
    }
    return StepOutcome::success();
}

int FlightManager::run() {
    if (!references_.empty())
        publishReferences();

    ros::Rate rate(control_rate_);
    controller_->start(ros::Time::now().toSec());
    bool vis_warned = false;
    while (ros::ok() && !controller_->isFinished()) {
        ros::spinOnce();
        controller_->tick(ros::Time::now().toSec());

        StepOutcome vis = publishDesired();
        if (!vis.ok && !vis_warned) {
            ROS_WARN("[flight_manager] %s, ignored", vis.error.c_str());
            vis_warned = true;
        }
        rate.sleep();
    }

    if (!controller_->isFinished()) {
        // ros 被关闭时仍然下发一次降落指令
        ROS_WARN("[flight_manager] shutdown during %s, sending land command", toString(controller_->phase()));
        for (size_t i = 0; i < links_.size(); i++) links_[i]->landInPlace();
    }

    report();
    if (controller_->phase() == FlightPhase::DONE)
        return 0;
    ROS_ERROR("[flight_manager] flight ended with %s (reason %s)", toString(controller_->phase()), toString(controller_->abortReason()));
    return 1;
}

void FlightManager::report() {
    for (size_t i = 0; i < controller_->vehicleCount(); i++) {
        const FlightDataRecorder& rec = controller_->recorder(i);
        if (save_flag_ && rec.size() > 0) {
            try {
                rec.saveToCsv(save_dir_);
            } catch (const std::exception& e) {
                ROS_ERROR("[flight_manager] failed to save flight data for %s: %s", vehicle_names_[i].c_str(), e.what());
            }
        }

        FlightDataAnalyzer analyzer(rec.samples());
        FlightStatistics stats = analyzer.getStatistics();
        if (stats.num_samples == 0) {
            ROS_WARN("[flight_manager] %s: no flight data recorded", vehicle_names_[i].c_str());
            continue;
        }
        ROS_INFO("[flight_manager] %s: %d samples over %.2f s", vehicle_names_[i].c_str(), stats.num_samples, stats.total_time);
        ROS_INFO("[flight_manager]   RMS  error x %.4f y %.4f z %.4f m", stats.pos_rms_error(0), stats.pos_rms_error(1), stats.pos_rms_error(2));
        ROS_INFO("[flight_manager]   mean error x %.4f y %.4f z %.4f m", stats.pos_mean_error(0), stats.pos_mean_error(1), stats.pos_mean_error(2));
        ROS_INFO("[flight_manager]   max  error x %.4f y %.4f z %.4f m", stats.pos_max_error(0), stats.pos_max_error(1), stats.pos_max_error(2));
    }
}

}  // namespace traj_tracking
