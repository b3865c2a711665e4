#include <dispo/dispolib.h>

#include <cerrno>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sys/time.h>

namespace Dispo
{

std::stringstream ErrStream::store;
std::stringstream ErrStream::stamp;

namespace
{

static bool timestamp=false;
static std::mutex error_stream_synchronizer;

/* Write the whole buffer to stderr. There is nowhere left to report a
   failing stderr to, so we stop on any error other than an interrupt */
void WriteToStderr(const char *data, std::size_t len)
{
        while (len > 0)
        {
                ssize_t written = write(2, data, len);
                if (written < 0)
                {
                        if (errno == EINTR)
                            continue;
                        return;
                }
                data += written;
                len -= std::size_t(written);
        }
}

}

void ErrStream::SetTimestamping(bool enable)
{
        std::lock_guard<std::mutex> lock(error_stream_synchronizer);
        timestamp=enable;
}

ErrStream::ErrStream()
{
        error_stream_synchronizer.lock();
        try
        {
                if(timestamp)
                {
                        struct timeval now;
                        gettimeofday(&now, nullptr);
                        std::time_t now_secs = now.tv_sec;
                        std::tm now_tm;
                        localtime_r(&now_secs, &now_tm);

                        stamp << "[" << std::right << std::setw(2) << std::setfill('0') << now_tm.tm_mday << "-" << std::setw(2) << std::setfill('0') << (now_tm.tm_mon+1) << "-" << (now_tm.tm_year+1900) << " ";
                        stamp << std::right << std::setw(2) << std::setfill(' ') << now_tm.tm_hour << ":" << std::setw(2) << std::setfill('0') << now_tm.tm_min << ":" << std::setw(2) << std::setfill('0') << now_tm.tm_sec << ":" << std::setw(3) << std::setfill('0') << (now.tv_usec / 1000) << "] ";
                }
        }
        catch(std::exception &)
        {
                stamp.str("");
                error_stream_synchronizer.unlock();
                throw;
        }
}

ErrStream::~ErrStream()
{
        try
        {
                //Every line of the entry gets its own copy of the stamp
                store << '\n';
                std::string finaldata = stamp.str();
                unsigned stamp_size = finaldata.size();
                finaldata += store.str();
                store.str("");
                stamp.str("");
                while (true)
                {
                        std::string::iterator next_lf = std::find(finaldata.begin() + stamp_size, finaldata.end(),'\n');
                        std::size_t to_write = next_lf - finaldata.begin() + 1;
                        WriteToStderr(finaldata.c_str(), to_write);

                        if (next_lf + 1 == finaldata.end() || next_lf + 2 == finaldata.end())
                            break;
                        finaldata.erase(finaldata.begin() + stamp_size, next_lf + 1);
                }
        }
        catch(std::bad_alloc &)
        {
                /* Ignore allocation errors for the str() stuff */
        }
        error_stream_synchronizer.unlock();
}

} //end namespace Dispo
