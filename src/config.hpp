#pragma once

/*compile-time knobs, override with -D (see CMakeLists.txt)*/

/*byte that ends the session, default Ctrl-D*/
#ifndef RAWPAD_KEY_QUIT
#define RAWPAD_KEY_QUIT 4
#endif

#define RAWPAD_KEY_ESCAPE    27
#define RAWPAD_KEY_ENTER     '\n'
#define RAWPAD_KEY_BACKSPACE 127

/*escape sequences are matched only at exactly this many buffered bytes*/
#ifndef RAWPAD_ESCAPE_WINDOW
#define RAWPAD_ESCAPE_WINDOW 3
#endif

/*pending escape accumulator size*/
#define RAWPAD_ESCAPE_CAPACITY 4

#if RAWPAD_ESCAPE_WINDOW < 3 || RAWPAD_ESCAPE_WINDOW > RAWPAD_ESCAPE_CAPACITY
#error "RAWPAD_ESCAPE_WINDOW must be between 3 and RAWPAD_ESCAPE_CAPACITY"
#endif
