#define CATCH_CONFIG_MAIN
#define TEST_CALC
#include "calc.hpp"
