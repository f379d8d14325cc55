// Base.h includes things that are needed in most covmark code in one
// place, so they don't have to be repeatedly specified.
#pragma once

// google log utilities: CHECK macro, etc.
#include "glog/logging.h"

// Runs one-time initialization common to covmark programs and test
// binaries.  This does the following:
//
// * Initializes GLOG so that CHECK failures and usage faults get a
//   stack trace
//
// * Sets up covmark logging, using the program name as the log
//   identity.
void covmark_init(int* argc, char*** argv);
