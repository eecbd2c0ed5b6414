// tests/test_main.cpp
//
// Единственная единица трансляции тестов с DOCTEST_CONFIG_IMPLEMENT.
// Остальные файлы подключают doctest без этого макроса.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <cstdlib>
#include <cstring>

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;

    context.setOption("order-by", "name");
    context.setOption("duration", true);

    // В CI без цветов в логах
    if (env_truthy(std::getenv("CI"))) {
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();
    if (context.shouldExit())
        return res;

    return res;
}
