#ifndef INCLUDE_SNIPBOX_UTILS_H_
#define INCLUDE_SNIPBOX_UTILS_H_

#include "results.h"

const char* OutcomeToDesc(Outcome);
const char* OutcomeToAbr(Outcome);

#endif  // INCLUDE_SNIPBOX_UTILS_H_
