#ifndef SLOT_TEST_H
#define SLOT_TEST_H

int run_tst_optional_slot_api_paranoid(int argc, char** argv);

#endif // SLOT_TEST_H
