#ifndef TCLCOMPAT_H
#define TCLCOMPAT_H

#include <tcl.h>

/* Tcl 9 sizes lists and strings with Tcl_Size, 8.6 uses int */
#if TCL_MAJOR_VERSION < 9 && !defined(TCL_SIZE_MAX)
typedef int Tcl_Size;
#endif

#endif
