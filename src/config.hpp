#pragma once

/*compile-time defaults, overridable with -D*/

#ifndef TA_DEFAULT_TAB_WIDTH
#define TA_DEFAULT_TAB_WIDTH 4
#endif

#ifndef TA_RC_FILE_NAME
#define TA_RC_FILE_NAME ".textarearc"
#endif

#ifndef TA_DEFAULT_TITLE
#define TA_DEFAULT_TITLE "textarea"
#endif

#define TA_KEY_ESC 27
#define TA_KEY_DEL 127
