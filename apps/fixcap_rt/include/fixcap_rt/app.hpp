#pragma once

#include "camera/webcam_source.hpp"
#include "config/session_config.hpp"
#include "managers/broadcast_manager.hpp"
#include "managers/graphics_manager.hpp"
#include <fixcap/core/core.hpp>
#include <memory>

namespace fixcap_rt {

class App {
  public:
    // Throws std::runtime_error on bad arguments or configuration
    explicit App(int argc, char **argv);

    void Launch();

    ~App();

  private:
    fixcap::core::MonitorGeometry resolveMonitorGeometry_();

    config::SessionConfig config_;

    std::shared_ptr<managers::GraphicsManager> graphicsManager_;
    std::shared_ptr<managers::BroadcastManager> broadcastManager_;
    std::shared_ptr<camera::WebcamSource> webcam_;
};

} // namespace fixcap_rt
