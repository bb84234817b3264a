#include <gtest/gtest.h>

#include <kernel/yosys.h>

int main(int argc, char **argv) {
    Yosys::yosys_setup();

    testing::InitGoogleTest(&argc, argv);
    int ret = RUN_ALL_TESTS();

    Yosys::yosys_shutdown();
    return ret;
}
