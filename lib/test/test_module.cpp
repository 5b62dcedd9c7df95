#include "Module.h"
#include "Service.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

class TestModule : public bx::Module {
public:
    explicit TestModule(const std::string& name) : bx::Module(name) {}
};

class CountingService : public bx::Service {
public:
    CountingService() : bx::Service("mt_service") {}
    ~CountingService() override { stop(); }

    std::atomic<int> loops{0};
    std::atomic<bool> stopRequested{false};
    bool stopped{false};
    bool failStart{false};

protected:
    Roe<void> onStart() override {
        if (failStart) {
            return Error(1, "refused");
        }
        return {};
    }

    void runLoop() override {
        while (!isStopSet()) {
            ++loops;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void onStopRequest() override { stopRequested = true; }
    void onStop() override { stopped = true; }
};

} // namespace

TEST(ModuleTest, LogReturnsLoggerReference) {
    TestModule module("mt_module");

    EXPECT_NO_THROW({
        module.log().info << "Test message";
        module.log().debug << "Debug message";
        module.log().warning << "Warning message";
    });

    EXPECT_EQ(module.log().getName(), "mt_module");
}

TEST(ModuleTest, LogIsConst) {
    const TestModule module("mt_const");
    EXPECT_NO_THROW(module.log().info << "Const test message");
    EXPECT_EQ(module.log().getName(), "mt_const");
}

TEST(ModuleTest, DottedNamePlacesLoggerInTree) {
    TestModule module("mt_explorer.rpc");
    EXPECT_EQ(module.log().getName(), "rpc");
    EXPECT_EQ(module.log().getFullName(), "mt_explorer.rpc");
    EXPECT_EQ(module.log(), bx::logging::getLogger("mt_explorer.rpc"));
}

TEST(ServiceTest, StartRunsLoopAndStopJoins) {
    CountingService service;
    EXPECT_TRUE(service.isStopSet());

    ASSERT_TRUE(service.start().isOk());
    EXPECT_FALSE(service.isStopSet());
    while (service.loops.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    service.stop();
    EXPECT_TRUE(service.isStopSet());
    EXPECT_TRUE(service.stopRequested);
    EXPECT_TRUE(service.stopped);
}

TEST(ServiceTest, FailedStartLeavesServiceStopped) {
    CountingService service;
    service.failStart = true;
    auto r = service.start();
    ASSERT_TRUE(r.isError());
    EXPECT_NE(r.error().message.find("refused"), std::string::npos);
    EXPECT_TRUE(service.isStopSet());
    EXPECT_EQ(service.loops.load(), 0);
}

TEST(ServiceTest, DoubleStartIsRejected) {
    CountingService service;
    ASSERT_TRUE(service.start().isOk());
    EXPECT_TRUE(service.start().isError());
    service.stop();
}
