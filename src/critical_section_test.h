#ifndef CRITICAL_SECTION_TEST_H
#define CRITICAL_SECTION_TEST_H

int run_tst_critical_section_api_paranoid(int argc, char** argv);

#endif // CRITICAL_SECTION_TEST_H
