#ifndef STATIC_CELL_TEST_H
#define STATIC_CELL_TEST_H

int run_tst_static_cell_api_paranoid(int argc, char** argv);

#endif // STATIC_CELL_TEST_H
