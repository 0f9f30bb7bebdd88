#ifndef NBKP_TESTS_HPP
#define NBKP_TESTS_HPP

/** Runs every implementation test. Failures abort through `assert`.
 * @return zero when all tests pass */
int run_tests();

#endif // NBKP_TESTS_HPP
