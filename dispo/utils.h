#ifndef dispo_utility
#define dispo_utility

#ifndef dispo_dispolib
#include "dispolib.h"
#endif

#include <vector>

namespace Dispo
{

/** Invoke the user's main function, with the arguments as a string list.
    Exceptions escaping from the main function are reported to stderr and
    turn into a failure exit code */
DISPOLIB_PUBLIC int InvokeMyMain(int _argc,
                         char *_argv[],
                         int (*utf8main)(std::vector<std::string> const &args));

/** Read a line from stdin, without its line terminator (LF or CRLF)
    @param line Receives the line
    @return false at end of input, if nothing was read. Throws std::runtime_error on read errors */
DISPOLIB_PUBLIC bool ReadConsoleLine(std::string *line);

} //end namespace Dispo
#endif
