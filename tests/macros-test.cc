#include <labeled-core/assert.hh>
#include <labeled-core/macros.hh>

#include <nexus/test.hh>

#include <string>

#include "assertion-helper.hh"

// exactly one compiler and one OS, clang and gcc count as posix
static_assert(1 == 0
#ifdef LC_COMPILER_MSVC
                       + 1
#endif
#ifdef LC_COMPILER_CLANG
                       + 1
#endif
#ifdef LC_COMPILER_GCC
                       + 1
#endif
              ,
              "expected exactly one compiler");

static_assert(1 == 0
#ifdef LC_OS_WINDOWS
                       + 1
#endif
#ifdef LC_OS_LINUX
                       + 1
#endif
#ifdef LC_OS_APPLE
                       + 1
#endif
#ifdef LC_OS_BSD
                       + 1
#endif
              ,
              "expected exactly one OS");

#if defined(LC_COMPILER_POSIX) == defined(LC_COMPILER_MSVC)
#error "LC_COMPILER_POSIX must be set for clang and gcc only"
#endif

// the misuse tests need LC_ASSERT in every configuration
static_assert(LC_ASSERT_ENABLED == 1);

namespace
{
LC_FORCE_INLINE int forced_twice(int v) { return 2 * v; }

LC_COLD_FUNC std::string cold_path(int code) { return "code " + std::to_string(code); }
} // namespace

TEST("macros - LC_UNUSED type-checks without evaluating")
{
    int x = 0;
    LC_UNUSED(++x);
    CHECK(x == 0);

    int calls = 0;
    auto call = [&calls]() -> int { return ++calls; };
    LC_UNUSED(call());
    CHECK(calls == 0);
}

TEST("macros - attributes do not change behavior")
{
    CHECK(forced_twice(21) == 42);
    CHECK(cold_path(7) == "code 7");
}

TEST("macros - checks are active in the test build")
{
    CHECK(test::reports_misuse([] { LC_ASSERT(false, "enabled"); }));
    CHECK(test::reports_misuse([] { LC_ASSERT_SLOT(false, "enabled", "_"); }));
    CHECK(!test::reports_misuse([] { LC_ASSERT(true, "silent"); }));
}
