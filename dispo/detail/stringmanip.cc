#include <iterator>
#include <limits>
#include <cstring>
#include <vector>

namespace Dispo
{

//--------------------------------------------------------------------------
//
// String to number encodings
//
//--------------------------------------------------------------------------

/* This is the actual encoder class - two versions will be generated, one which
   supports signed types, and one which supports unsigned types */
template <typename NumberType, class OutputIterator, bool Signed>
  class dispo_Encoder
{
        public:
        static OutputIterator EncodeNumber(NumberType value, signed radix, OutputIterator output);
};

template <typename NumberType, class OutputIterator>
  class dispo_Encoder<NumberType,OutputIterator,false>
{
        public:
        static OutputIterator EncodeNumber(NumberType value, signed radix, OutputIterator output)
        {
                char buf[128];

                if (radix<2||radix>36) //out of range?
                    return output;

                //store the number into buf, reversed
                char *bufptr=buf;
                do
                {
                        uint8_t num = uint8_t(value % radix);
                        *bufptr++=char(num >= 10 ? ('A' + num - 10) : ('0' + num));
                        value = static_cast<NumberType>(value / radix);
                }
                while (value > 0);

                while (bufptr>buf)
                    *output++=*--bufptr;
                return output;
        }
};

template <typename NumberType, class OutputIterator>
  class dispo_Encoder<NumberType,OutputIterator,true>
{
        public:
        static OutputIterator EncodeNumber(NumberType value, signed radix, OutputIterator output)
        {
                if (value >= 0)
                    return dispo_Encoder<uint64_t,OutputIterator,false>::EncodeNumber(static_cast<uint64_t>(value), radix, output);

                *output++='-';
                // Negate through the unsigned type, -128 and friends can't be negated in their own type
                return dispo_Encoder<uint64_t,OutputIterator,false>::EncodeNumber(uint64_t(0) - static_cast<uint64_t>(value), radix, output);
        }
};

/* This is the externally called functions - we use the numeric_limits to pick
   the proper decoder (signed or unsigned) at compile-time */
template <typename NumberType, class OutputIterator>
  OutputIterator EncodeNumber(NumberType value, unsigned radix, OutputIterator output)
{
        return dispo_Encoder<NumberType, OutputIterator, std::numeric_limits<NumberType>::is_signed> ::EncodeNumber (value,radix,output);
}

template <typename NumberType, class InputIterator>
  std::pair<NumberType,InputIterator> DecodeUnsignedNumber(InputIterator begin, InputIterator end, unsigned radix)
{
        NumberType num=0;
        NumberType const maxval = std::numeric_limits<NumberType>::max();

        for (;begin!=end;++begin)
        {
                int digit = HexDigitValue(*begin);
                if (digit < 0 || unsigned(digit) >= radix || radix > 16)
                    break;

                //would this digit overflow the number?
                if (num > (maxval - NumberType(digit)) / radix)
                    break;
                num = static_cast<NumberType>(num * radix + digit);
        }
        return std::make_pair(num,begin);
}

template <typename CharType> inline int HexDigitValue(CharType ch)
{
        if (ch>='0' && ch<='9') return int(ch - '0');
        if (ch>='A' && ch<='F') return int(ch - 'A' + 10);
        if (ch>='a' && ch<='f') return int(ch - 'a' + 10);
        return -1;
}

//--------------------------------------------------------------------------
//
// String to string conversions and comparisons: generic implementations
//
//--------------------------------------------------------------------------

template <class Itr> int StrCaseCompare(Itr lhs_begin, Itr lhs_end,
                                        Itr rhs_begin, Itr rhs_end)
{
        while (lhs_begin != lhs_end)
        {
                if (rhs_begin == rhs_end)
                    return 1; //if rhs is longer than lhs, lhs < rhs

                uint8_t lhs = uint8_t(*lhs_begin);
                uint8_t rhs = uint8_t(*rhs_begin);
                if (lhs>='a' && lhs<='z') lhs &= 0xDF; //uppercase converison
                if (rhs>='a' && rhs<='z') rhs &= 0xDF; //uppercase converison

                int difference = int(lhs) - int(rhs);
                if (difference)
                    return difference > 0 ? 1 : -1;

                ++lhs_begin;
                ++rhs_begin;
        }
        return rhs_begin==rhs_end ? 0 : -1;
}

inline int StrCaseCompare(const std::string& lhs, const char* rhs_str)
{ return StrCaseCompare<const char*>(lhs.data(),lhs.data()+lhs.size(),rhs_str,rhs_str+strlen(rhs_str)); }
inline int CStrCaseCompare(const char* lhs_str, const char* rhs_str)
{ return StrCaseCompare(lhs_str,lhs_str+strlen(lhs_str),rhs_str,rhs_str+strlen(rhs_str)); }

inline bool StrLike(const std::string& lhs, const std::string& rhs)
{ return StrLike(lhs.begin(),lhs.end(),rhs.begin(),rhs.end()); }

inline bool StrCaseEndsWith(std::string const &str, std::string const &suffix)
{
        return str.size() >= suffix.size()
               && StrCaseCompare(str.end() - suffix.size(), str.end(), suffix.begin(), suffix.end()) == 0;
}

//--------------------------------------------------------------------------
//
// Base64 decoding
//
//--------------------------------------------------------------------------

namespace Detail
{
/** Get the 6-bit value of a base64 digit, or 0xff if it is not a base64 digit */
inline uint8_t Base64DigitValue(uint32_t ch)
{
        if (ch>='A' && ch<='Z') return uint8_t(ch - 'A');
        if (ch>='a' && ch<='z') return uint8_t(ch - 'a' + 26);
        if (ch>='0' && ch<='9') return uint8_t(ch - '0' + 52);
        if (ch=='+') return 62;
        if (ch=='/') return 63;
        return 0xff;
}

//Ensure safe upcasting of signed types (ie, don't convert char 166 to -90 before doing further conversion)
inline uint32_t CodeUnitValue(char ch) { return static_cast<unsigned char>(ch); }
inline uint32_t CodeUnitValue(signed char ch) { return static_cast<unsigned char>(ch); }
inline uint32_t CodeUnitValue(unsigned char ch) { return ch; }
inline uint32_t CodeUnitValue(uint32_t ch) { return ch; }
} //end namespace Detail

/** Base-64 decoder class. Maps 4x6 bits to 3x8 bits */
template <class OutputIterator> class DecoderBase64
{
        int bytecount;
        int savebyte;

        public:
        /** Initialize the decoder, waiting for a byte */
        inline DecoderBase64(OutputIterator _output) : bytecount(0), savebyte(0), output(_output)
        {
        }

        /** Decode a single base64 digit (must be a valid digit value, 0-63) */
        inline void operator() (uint8_t truebyte)
        {
                if (bytecount==0) //First byte, contains 6 high bits of byte 0
                {
                        savebyte=truebyte;
                        ++bytecount;
                }
                else if (bytecount==1) //Second byte, contains 2 low bits of byte 0, and 4 high bits of byte 1
                {
                        *output++=uint8_t(savebyte << 2) | uint8_t(truebyte >> 4);
                        savebyte=truebyte;
                        ++bytecount;
                }
                else if (bytecount==2) ////Third byte, contains 4 low bits of byte 1 and 2 high bits of byte 2
                {
                        *output++=uint8_t(savebyte<<4) | uint8_t(truebyte >> 2);
                        savebyte=truebyte;
                        ++bytecount;
                }
                else if (bytecount==3) //Fourth byte, contains the 6 low bits of byte 3;
                {
                        bytecount=0;
                        *output++=uint8_t(savebyte<<6) | truebyte;
                }
        }

        OutputIterator output;
};

template <class InputIterator, class OutputIterator> bool DecodeForgivingBase64(InputIterator begin,InputIterator end, OutputIterator output)
{
        //Collect the digits, skipping ASCII whitespace (tab, LF, FF, CR and space)
        std::vector<uint32_t> digits;
        for (;begin!=end;++begin)
        {
                uint32_t ch = Detail::CodeUnitValue(*begin);
                if (ch==' ' || ch=='\t' || ch=='\n' || ch=='\f' || ch=='\r')
                    continue;
                digits.push_back(ch);
        }

        //Strip the padding, but only if it completes a quad
        if (digits.size() % 4 == 0 && !digits.empty() && digits.back()=='=')
        {
                digits.pop_back();
                if (!digits.empty() && digits.back()=='=')
                    digits.pop_back();
        }
        if (digits.size() % 4 == 1)
            return false;

        DecoderBase64<OutputIterator &> out(output);
        for (unsigned i=0;i<digits.size();++i)
        {
                uint8_t truebyte = Detail::Base64DigitValue(digits[i]);
                if (truebyte == 0xff)
                    return false;
                out(truebyte);
        }
        return true;
}

//--------------------------------------------------------------------------
//
// String to string conversions and comparisons: complex comparisons
//--------------------------------------------------------------------------
template <class Iterator>
   bool StringGlob(Iterator mask_ptr,Iterator mask_end,
                            Iterator check_ptr,Iterator check_end,
                            bool case_sensitive)
{
        Iterator mask_retry = Iterator();
        Iterator check_retry = Iterator();
        bool have_retry_point = false;

        while (true)
        {
                if (mask_ptr == mask_end) //end of pattern
                {
                        if (check_ptr != check_end) //not at end of text, retry
                        {
                                if (!have_retry_point)
                                    return false;

                                mask_ptr = mask_retry;
                                check_ptr = ++check_retry;
                                continue;
                        }
                        return true; //end of text too, match
                }

                if (*mask_ptr == '*') //forget all we parsed so far, always retry here..
                {
                        mask_retry = ++mask_ptr;
                        if(mask_retry == mask_end) //common case, mask ending with '*'
                           return true;

                        check_retry = check_ptr;
                        have_retry_point = true;
                        continue;
                }

                if (check_ptr == check_end)
                    return false; //end of text, not end of pattern, failure

                uint32_t curmask = uint8_t(*mask_ptr);
                uint32_t curchar = uint8_t(*check_ptr);
                if (!case_sensitive)
                {
                        curmask = ToLower(curmask);
                        curchar = ToLower(curchar);
                }

                if (curmask == '?' || curmask == curchar)
                {
                        ++mask_ptr;
                        ++check_ptr;
                }
                else
                {
                        if (!have_retry_point)
                            return false;

                        mask_ptr = mask_retry;
                        check_ptr = ++check_retry;
                }
        }
}

//--------------------------------------------------------------------------
//
// Any to string
//
//--------------------------------------------------------------------------

template <> inline void AppendAnyToString(unsigned int const &in, std::string *appended_string)
{
        EncodeNumber(in, 10, std::back_inserter(*appended_string));
}
template <> inline void AppendAnyToString(signed int const &in, std::string *appended_string)
{
        EncodeNumber(in, 10, std::back_inserter(*appended_string));
}
template <> inline void AppendAnyToString(unsigned long const &in, std::string *appended_string)
{
        EncodeNumber(in, 10, std::back_inserter(*appended_string));
}
template <> inline void AppendAnyToString(signed long const &in, std::string *appended_string)
{
        EncodeNumber(in, 10, std::back_inserter(*appended_string));
}
template <> inline void AppendAnyToString(std::string const &in, std::string *appended_string)
{
        *appended_string += in;
}

template <typename T> std::string AnyToString(T const &in)
{
        std::string retval;
        AppendAnyToString(in, &retval);
        return retval;
}

} //end namespace Dispo
