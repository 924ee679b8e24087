#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        FLAGS_logtostderr = true;
        FLAGS_minloglevel = google::WARNING;
    }

    void TearDown() override {
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
