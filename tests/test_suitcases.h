#ifndef CODEBREAK_TESTS_SUITCASES_H
#define CODEBREAK_TESTS_SUITCASES_H

#include <check.h>
#include <limits.h>
#include <stdbool.h>

#include "../src/brick_game/common/cb_bgame_cmn.h"
#include "../src/fsm/fsm.h"

Suite *suite_fsm(void);
Suite *suite_bgame_cmn(void);

int run_tests(void);
int run_testcase(Suite *testcase);

#endif
