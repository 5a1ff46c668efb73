#ifndef __I18N_H__
#define __I18N_H__

// copyright (C) 2005 nathaniel smith <njs@pobox.com>
// all rights reserved.
// licensed to the public under the terms of the GNU GPL (>= 2)
// see the file COPYING for details

// message catalog glue; include this rather than <libintl.h>

#include <libintl.h>

#define _(str) gettext(str)
#define N_(str) (str)

void localize_flexarc();

#endif
