#ifndef dispo_dispolib
#define dispo_dispolib

#ifndef _XOPEN_SOURCE
 #define _XOPEN_SOURCE 600
#endif

#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <functional>
#include <memory>
#include <unistd.h>
#include <sstream>


#define DISPO_NOOP_STATEMENT (void)0

#define LOGPRINT(x) do { ::Dispo::ErrStream() << x ; } while (0)

#ifdef DEBUG
  #define DEBUGPRINT(x) LOGPRINT(x)
#else
  //Supply dummy DEBUG defines
  #define DEBUGPRINT(x) DISPO_NOOP_STATEMENT
#endif

/** Make stuff visibile in -fvisiblity=hidden (much like DLL export/import) */
#define DISPOLIB_PUBLIC __attribute__((visibility("default")))

using std::uint8_t;
using std::uint16_t;
using std::uint32_t;
using std::uint64_t;
using std::int32_t;
using std::int64_t;

namespace Dispo
{

/** Error stream, an auto-serializing debugging/error logging class. Every
    ErrStream object collects one log entry and writes it, as whole lines,
    to stderr when it is destroyed */
class DISPOLIB_PUBLIC ErrStream
{
        private:
        static std::stringstream stamp;
        static std::stringstream store;

        public:
        ErrStream();
        ~ErrStream();

        template <class Data> std::ostream& operator<<(Data const &data)
        {
                return store << data;
        }

        /** Place timestamps before log entries? */
        static void SetTimestamping(bool enable);
};

//stringmanip.h - EVERYBODY needs it, so just include it ourselves

/** Range pattern matching */
template <class Iterator>
  bool StringGlob(Iterator mask_begin,Iterator mask_end,Iterator check_begin,Iterator check_end,bool case_sensitive);

/** Case insensitive string compare */
template <class Itr> int StrCaseCompare(Itr lhs_begin, Itr lhs_end, Itr rhs_begin, Itr rhs_end);

/** Case insensitive C string compare */
inline int CStrCaseCompare(const char* lhs_str, const char* rhs_str);

/** Case sensitive string glob pattern matching */
template <class Itr> bool StrLike(Itr lhs_begin, Itr lhs_end,Itr rhs_begin, Itr rhs_end)
  { return StringGlob(rhs_begin, rhs_end, lhs_begin, lhs_end, true); }

/** Does the string end with the specified suffix, ignoring ASCII case? */
inline bool StrCaseEndsWith(std::string const &str, std::string const &suffix);

/** BASE64 decode, in the forgiving form browsers use for atob(): ASCII
    whitespace is skipped, up to two '=' padding bytes are accepted at the
    end, anything else that is not in the base64 alphabet is an error
    @param begin Input iterator pointing to start of range to decode
    @param end Input iterator pointing to limit of range to decode
    @param output output iterator receiving decoded data. May have received
                  partial data if decoding fails
    @return true if the range was valid base64 */
template <class InputIterator, class OutputIterator> bool DecodeForgivingBase64(InputIterator begin,InputIterator end, OutputIterator output);

/** Encode a number to any radix 2-36 (decimal, binary, hexadecimal etc) format
    @param num Number to convert
    @param radix Radix for conversion (2 to 36)
    @param output Output that receives the encoded number
    @return New output iteration position */
template <typename NumberType, class OutputIterator>
  OutputIterator EncodeNumber(NumberType num, unsigned radix, OutputIterator output);

/** Decode an unsigned number in a string, consisting of arabic digits
    @param NumberType Requested storage type for the number
    @param InputIterator Input iterator type
    @param begin Begin of data to parse the number from
    @param end End of data to parse the number from
    @return A pair, where first is the parsed number, and second is the iterator
            where parsing stopped - if the return iterator==end, then the number
            was valid, otherwise the returned iterator points to the first invalid
            character. Parsing also stops before a digit that would overflow
            NumberType */
template <typename NumberType, class InputIterator>
  std::pair<NumberType,InputIterator> DecodeUnsignedNumber(InputIterator begin, InputIterator end, unsigned radix=10);

/** Get the value of a hexadecimal digit
    @return The value (0-15), or -1 if the character is not a hexadecimal digit */
template <typename CharType> inline int HexDigitValue(CharType ch);

/** Is the character in the range A-Z or a-z? ASCII-only versions of isalpha */
template <typename CharType> inline bool IsAlpha(CharType ch) { return (ch>='a' && ch<='z') || (ch>='A' && ch<='Z'); }
/** Is the character a digit? ASCII-only versions of isdigit */
template <typename CharType> inline bool IsDigit(CharType ch) { return ch>='0' && ch<='9'; }
/** Is the character in the range A-Z, a-z or 0-9? ASCII-only versions of isalnum*/
template <typename CharType> inline bool IsAlNum(CharType ch) { return IsDigit(ch) || IsAlpha(ch); }
/** Convert the character to lowercase */
template <typename CharType> inline CharType ToLower(CharType ch) { return ch>='A'&&ch<='Z' ? (CharType)(ch^0x20) : ch; }

/** Append any type to string */
template <typename T> void AppendAnyToString(T const &in, std::string *appended_string);
/** Convert any type to string */
template <typename T> std::string AnyToString(T const &in);

} //end namespace Dispo

//compile the implementations
#include "detail/stringmanip.cc"

#include <limits>
#include <vector>

#endif
