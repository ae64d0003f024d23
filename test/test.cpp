#define XDUCE_TD_ENABLE_RUN_TESTS 1
#define XDUCE_COLLECT_ENABLE_RUN_TESTS 1
#define XDUCE_PIPELINE_ENABLE_RUN_TESTS 1

// pipeline.hpp pulls in collect.hpp, which pulls in td.hpp;
// the self-tests of each must be compiled regardless of that order.
#include <xduce/pipeline.hpp>
#include <xduce/collect.hpp>
#include <xduce/td.hpp>

int main()
{
#if XDUCE_TD_ENABLE_RUN_TESTS
    xduce::td::impl::run_tests();
#endif

#if XDUCE_COLLECT_ENABLE_RUN_TESTS
    xduce::td::impl::collect_tests::run_tests();
#endif

#if XDUCE_PIPELINE_ENABLE_RUN_TESTS
    xduce::td::impl::pipeline_tests::run_tests();
#endif

    return 0;
}
