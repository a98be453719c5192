// tests/test_main.cpp
//
// 测试可执行文件中唯一定义 DOCTEST_CONFIG_IMPLEMENT 的翻译单元，
// 其他测试文件只包含 doctest 头文件。
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

namespace {

bool envTruthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

}  // namespace

int main(int argc, char** argv) {
    // 处理器失败等预期错误会打日志，默认静默，EVENTCORE_TEST_VERBOSE=1 时全部输出
    trantor::Logger::setLogLevel(envTruthy(std::getenv("EVENTCORE_TEST_VERBOSE"))
        ? trantor::Logger::kTrace : trantor::Logger::kFatal);

    doctest::Context context;
    context.setOption("order-by", "name");
    context.setOption("duration", true);

    if (envTruthy(std::getenv("CI"))) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    return context.run();
}
