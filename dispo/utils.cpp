#include <dispo/dispolib.h>
#include "utils.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>

namespace Dispo
{

namespace
{

std::size_t ReadConsoleBytes(void *buf, unsigned numbytes)
{
        while (true)
        {
                ssize_t result = read(0,buf,numbytes);
                if (result==-1 && errno==EINTR)
                    continue;
                if (result<0)
                    throw std::runtime_error(std::string("Cannot read from stdin: ") + std::strerror(errno));
                return static_cast<std::size_t>(result);
        }
}

} //end anonymous namespace

int InvokeMyMain(int _argc, char *_argv[],int (*utf8main)(std::vector<std::string> const &args))
{
        signal(SIGPIPE,SIG_IGN);

        //Make stdin blocking - ReadConsoleBytes expects it that way
        int flags = fcntl(0,F_GETFL);
        if (flags != -1 && (flags & O_NONBLOCK) && fcntl(0,F_SETFL, flags & ~O_NONBLOCK) == -1)
            LOGPRINT("Unable to make stdin blocking: " << std::strerror(errno));

        int result;
        try
        {
                std::vector<std::string> args(_argv,_argv+_argc);
                result=(*utf8main)(args);
        }
        catch (std::exception &e)
        {
                LOGPRINT("Fatal error: " << e.what());
                result=EXIT_FAILURE;
        }
        std::cout.flush();
        return result;
}

bool ReadConsoleLine(std::string *line)
{
        std::cout.flush(); //make sure receiver is not waiting for us.....
        line->clear();
        while(true)
        {
                char inbuf;
                if (!ReadConsoleBytes(&inbuf, 1))
                    break;
                if(inbuf=='\n')
                {
                        if (!line->empty() && (*line)[line->size()-1]=='\r')
                            line->erase(line->size()-1);
                        return true;
                }
                line->push_back(inbuf);
        }
        //Last line without a terminator
        return !line->empty();
}

} //end namespace Dispo
