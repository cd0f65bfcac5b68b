#ifndef __WIDESHELL_VERSION_H
#define __WIDESHELL_VERSION_H

#define VERSINFO_COPYRIGHT L"Copyright © 2025 WideShell Authors"
#define VERSINFO_COMPANY L"WideShell"

#define VERSINFO_DESCRIPTION L"WideShell, safe wide strings and shell dialogs"

// conversion macros num->str
#define VERSINFO_xstr(s) VERSINFO_str(s)
#define VERSINFO_str(s) L## #s

#define VERSINFO_MAJOR 0
#define VERSINFO_MINORA 3
#define VERSINFO_MINORB 1

// VERSINFO_BUILDNUMBER: increment with every build handed to somebody else.
#define VERSINFO_BUILDNUMBER 12

#define VERSINFO_VERSION VERSINFO_xstr(VERSINFO_MAJOR) L"." VERSINFO_xstr(VERSINFO_MINORA) L"." VERSINFO_xstr(VERSINFO_MINORB)
#define VERSINFO_VERSION_FULL VERSINFO_VERSION L" (build " VERSINFO_xstr(VERSINFO_BUILDNUMBER) L")"

#endif // __WIDESHELL_VERSION_H
