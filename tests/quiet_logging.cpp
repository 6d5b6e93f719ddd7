/// @file quiet_logging.cpp
/// @brief Catch2 listener that drops engine logging to warnings for every test run

#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>

#include <spdlog/spdlog.h>

namespace {

class QuietLogging : public Catch::EventListenerBase {
  public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        spdlog::set_level(spdlog::level::warn);
    }
};

} // namespace

CATCH_REGISTER_LISTENER(QuietLogging)
