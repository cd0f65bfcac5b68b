// Every module that links WideShell gets its provider instance from here.
// The GUID is fixed, so one trace session receives events from all of them.
#define WIDESHELL_DEFINE_TRACE_PROVIDER
#include "Helpers.h"
