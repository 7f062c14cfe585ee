#include "Module.h"
#include <gtest/gtest.h>

#include <memory>

class TestModule : public pc::Module {
public:
    explicit TestModule(const std::string& name) : pc::Module(name) {}
};

TEST(ModuleTest, LogUsesModuleName) {
    TestModule module("test_module");

    EXPECT_NO_THROW({
        module.log().info << "Test message";
        module.log().debug << "Debug message";
        module.log().warning << "Warning message";
    });

    EXPECT_EQ(module.log().getName(), "test_module");
    EXPECT_EQ(module.log(), pc::logging::getLogger("test_module"));
}

TEST(ModuleTest, LogIsConst) {
    const TestModule module("const_test");
    EXPECT_NO_THROW(module.log().info << "Const test message");
    EXPECT_EQ(module.log().getName(), "const_test");
}

TEST(ModuleTest, LoggerRedirect) {
    TestModule module("redirect_test");
    auto spHandler = std::make_shared<pc::logging::MemoryHandler>();
    pc::logging::getLogger("redirect_sink").addHandler(spHandler);

    module.redirectLogger("redirect_sink");
    EXPECT_EQ(module.log().getParent(), pc::logging::getLogger("redirect_sink"));

    module.log().warning << "Message via redirect";
    EXPECT_TRUE(spHandler->contains("Message via redirect"));
}
