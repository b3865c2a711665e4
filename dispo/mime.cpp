#include <dispo/dispolib.h>
#include "mime.h"

#include <map>

namespace Dispo {

namespace Mime {

namespace
{

/* Whitespace around parameter names and values. Includes the non-breaking
   space, which browsers also skip here */
inline bool IsParamWhitespace(char ch)
{
        uint8_t byte = uint8_t(ch);
        return (byte>=0x09 && byte<=0x0D) || byte==0x20 || byte==0xA0;
}

std::string::size_type SkipParamWhitespace(std::string const &header, std::string::size_type ptr)
{
        while (ptr<header.size() && IsParamWhitespace(header[ptr]))
            ++ptr;
        return ptr;
}

/* Find the end of a parameter value (a token or quoted string) starting at
   'start'. Returns 'start' if no value starts there */
std::string::size_type FindParamValueEnd(std::string const &header, std::string::size_type start)
{
        if (start==header.size())
            return start;

        std::string::size_type ptr = start;
        if (header[ptr]=='"')
        {
                ++ptr;
                bool have_content = false;
                while (ptr<header.size() && header[ptr]!='"')
                {
                        //a backslash escapes a following quote
                        if (header[ptr]=='\\' && ptr+1<header.size() && header[ptr+1]=='"')
                            ++ptr;
                        ++ptr;
                        have_content = true;
                }
                if (!have_content) //"" is not a value
                    return start;
                if (ptr<header.size()) //closing quote, it's optional at the end of the header
                    ++ptr;
                return ptr;
        }

        if (header[ptr]==';' || IsParamWhitespace(header[ptr]))
            return start;
        while (ptr<header.size() && header[ptr]!=';' && !IsParamWhitespace(header[ptr]))
            ++ptr;
        return ptr;
}

/* Try to match a filename parameter at 'ptr' (the start of the header, or just behind a ';')
   @param fits_index Set to false if a continuation index was too large */
bool MatchFilenameParameter(std::string const &header, std::string::size_type ptr, FilenameParamForm form, FilenameParam *param, bool *fits_index)
{
        static const char filename[] = "filename";
        static const unsigned filename_len = sizeof filename - 1;

        *fits_index = true;
        param->index = 0;
        param->extended = false;

        ptr = SkipParamWhitespace(header, ptr);
        if (header.size() - ptr < filename_len
            || StrCaseCompare(header.data() + ptr, header.data() + ptr + filename_len, filename, filename + filename_len) != 0)
            return false;
        ptr += filename_len;

        if (form != PlainForm)
        {
                if (ptr==header.size() || header[ptr]!='*')
                    return false;
                ++ptr;
        }
        if (form == ContinuationForm)
        {
                std::string::size_type digits_start = ptr;
                while (ptr<header.size() && IsDigit(header[ptr]))
                    ++ptr;
                if (ptr==digits_start)
                    return false;
                if (header[digits_start]=='0' && ptr-digits_start>1) //no leading zeroes
                    return false;

                std::pair<uint32_t, std::string::const_iterator> index = DecodeUnsignedNumber<uint32_t>(header.begin()+digits_start, header.begin()+ptr);
                param->index = index.first;
                *fits_index = index.second == header.begin()+ptr;

                if (ptr<header.size() && header[ptr]=='*')
                {
                        param->extended = true;
                        ++ptr;
                }
        }

        ptr = SkipParamWhitespace(header, ptr);
        if (ptr==header.size() || header[ptr]!='=')
            return false;
        ptr = SkipParamWhitespace(header, ptr+1);

        std::string::size_type value_end = FindParamValueEnd(header, ptr);
        if (value_end==ptr)
            return false;

        param->start_value = ptr;
        param->end_value = value_end;
        return true;
}

inline bool IsCharsetChar(uint32_t ch)
{
        return IsAlNum(ch) || ch=='_' || ch=='-';
}

/* Match an encoded word =?charset?encoding?text?= at 'start'. On success,
   sets the component offsets and returns the offset just past the word,
   otherwise returns 'start' */
unsigned MatchEncodedWord(UnicodeString const &value, unsigned start, unsigned *charset_end, unsigned *text_start, unsigned *text_end)
{
        unsigned ptr = start;
        if (value.size()-ptr < 2 || value[ptr]!='=' || value[ptr+1]!='?')
            return start;
        ptr += 2;

        while (ptr<value.size() && IsCharsetChar(value[ptr]))
            ++ptr;
        *charset_end = ptr;

        if (value.size()-ptr < 3
            || value[ptr]!='?'
            || (value[ptr+1]!='Q' && value[ptr+1]!='q' && value[ptr+1]!='B' && value[ptr+1]!='b')
            || value[ptr+2]!='?')
            return start;
        ptr += 3;
        *text_start = ptr;

        //The text ends at the first "?=", a lone ? is permitted
        for (;ptr+1<value.size();++ptr)
        {
                if (value[ptr]=='?' && value[ptr+1]=='=')
                {
                        *text_end = ptr;
                        return ptr+2;
                }
        }
        return start;
}

/* Decode a single encoded word into 'word', as bytes */
void DecodeSingleWord(uint32_t encoding, UnicodeString::const_iterator text_start, UnicodeString::const_iterator text_end, UnicodeString *word)
{
        if (encoding=='Q' || encoding=='q')
        {
                QuotedPrintableDecoder< std::back_insert_iterator< UnicodeString > > qpd(std::back_inserter(*word));
                for (;text_start!=text_end;++text_start)
                    qpd(*text_start);
                qpd.Finish();
                return;
        }

        std::string bytes;
        if (DecodeForgivingBase64(text_start, text_end, std::back_inserter(bytes)))
        {
                *word = WidenLatin1(bytes);
        }
        else
        {
                //Broken base64, keep the text as is
                word->assign(text_start, text_end);
        }
}

} //end anonymous namespace

bool FindFilenameParameter(std::string const &header, std::string::size_type from, FilenameParamForm form, FilenameParam *param)
{
        bool fits_index;
        if (from==0 && MatchFilenameParameter(header, 0, form, param, &fits_index))
        {
                if (fits_index)
                    return true;
                from = param->end_value;
        }

        while (true)
        {
                from = header.find(';', from);
                if (from == std::string::npos)
                    return false;
                ++from;

                if (!MatchFilenameParameter(header, from, form, param, &fits_index))
                    continue;
                if (fits_index)
                    return true;

                //Index overflowed. Skip the entire parameter, its value may contain semicolons
                from = param->end_value;
        }
}

bool CollectContinuationParts(std::string const &header, std::vector<ContinuationPart> *parts)
{
        parts->clear();

        std::map<uint32_t, FilenameParam> found;
        FilenameParam param;
        std::string::size_type from = 0;
        while (FindFilenameParameter(header, from, ContinuationForm, &param))
        {
                from = param.end_value;
                if (found.count(param.index))
                {
                        if (param.index == 0) //a second filename*0 makes the whole thing invalid
                            return false;
                        continue; //only the first occurrence of an index counts
                }
                found.insert(std::make_pair(param.index, param));
        }

        //Parts must be consecutive, stop at the first missing index
        uint32_t expect = 0;
        for (std::map<uint32_t, FilenameParam>::const_iterator itr = found.begin(); itr != found.end() && itr->first == expect; ++itr, ++expect)
        {
                ContinuationPart part;
                part.index = itr->first;
                part.extended = itr->second.extended;
                part.fragment.assign(header, itr->second.start_value, itr->second.end_value - itr->second.start_value);
                parts->push_back(part);
        }
        return true;
}

std::string Rfc2616Unquote(std::string const &value)
{
        if (value.empty() || value[0]!='"')
            return value;

        static const char escaped_quote[] = "\\\"";
        std::string retval;
        std::string::size_type piece_start = 1;
        bool first = true;
        while (true)
        {
                std::string::size_type piece_end = value.find(escaped_quote, piece_start);
                if (piece_end == std::string::npos)
                    piece_end = value.size();

                //An unescaped quote ends the string
                std::string::size_type quote = value.find('"', piece_start);
                bool last = piece_end == value.size();
                if (quote < piece_end)
                {
                        piece_end = quote;
                        last = true;
                }

                if (!first)
                    retval += '"';
                first = false;

                //Remove backslash escapes, except for escaped line breaks
                for (std::string::size_type i = piece_start; i < piece_end; ++i)
                {
                        if (value[i]=='\\' && i+1<piece_end && value[i+1]!='\r' && value[i+1]!='\n')
                            ++i;
                        retval += value[i];
                }

                if (last)
                    return retval;
                piece_start = piece_end + 2;
        }
}

UnicodeString PercentUnescape(std::string const &value)
{
        UnicodeString retval;
        retval.reserve(value.size());

        for (std::string::size_type i = 0; i < value.size(); ++i)
        {
                if (value[i]=='%')
                {
                        if (i+6 <= value.size() && value[i+1]=='u')
                        {
                                std::pair<uint32_t, std::string::const_iterator> unit = DecodeUnsignedNumber<uint32_t>(value.begin()+i+2, value.begin()+i+6, 16);
                                if (unit.second == value.begin()+i+6)
                                {
                                        retval.push_back(unit.first);
                                        i += 5;
                                        continue;
                                }
                        }
                        if (i+3 <= value.size() && HexDigitValue(value[i+1]) >= 0 && HexDigitValue(value[i+2]) >= 0)
                        {
                                retval.push_back(uint32_t(HexDigitValue(value[i+1]) * 16 + HexDigitValue(value[i+2])));
                                i += 2;
                                continue;
                        }
                }
                retval.push_back(uint8_t(value[i]));
        }
        return retval;
}

UnicodeString WidenLatin1(std::string const &value)
{
        UnicodeString retval(value.size());
        for (std::string::size_type i = 0; i < value.size(); ++i)
            retval[i] = uint8_t(value[i]);
        return retval;
}

bool SplitExtValue(UnicodeString const &extvalue, std::string *charset, UnicodeString *value)
{
        UnicodeString::const_iterator charset_end = std::find(extvalue.begin(), extvalue.end(), uint32_t('\''));
        if (charset_end == extvalue.end())
            return false;

        *charset = EncodeUTF8(UnicodeString(extvalue.begin(), charset_end));

        //Skip the language, if any
        UnicodeString::const_iterator value_start = charset_end + 1;
        UnicodeString::const_iterator language_end = std::find(value_start, extvalue.end(), uint32_t('\''));
        if (language_end != extvalue.end())
            value_start = language_end + 1;

        value->assign(value_start, extvalue.end());
        return true;
}

void DecodeEncodedWords(UnicodeString const &value, TextDecodeCallback const &textdecode, UnicodeString *decoded_output)
{
        //Only decode values that start with an encoded word and contain nothing but printable ASCII and (already decoded) text
        bool decodable = value.size() >= 2 && value[0]=='=' && value[1]=='?';
        for (unsigned i=0; decodable && i<value.size(); ++i)
            if (value[i] <= 0x19 || (value[i] >= 0x80 && value[i] <= 0xFF))
                decodable = false;

        if (!decodable)
        {
                decoded_output->insert(decoded_output->end(), value.begin(), value.end());
                return;
        }

        unsigned ptr = 0;
        while (ptr < value.size())
        {
                unsigned charset_end, text_start, text_end;
                unsigned word_end = MatchEncodedWord(value, ptr, &charset_end, &text_start, &text_end);
                if (word_end == ptr)
                {
                        decoded_output->push_back(value[ptr]);
                        ++ptr;
                        continue;
                }

                std::string charset(value.begin() + ptr + 2, value.begin() + charset_end);
                UnicodeString word;
                DecodeSingleWord(value[text_start-2], value.begin() + text_start, value.begin() + text_end, &word);
                if (!textdecode(charset, &word))
                    DEBUGPRINT("Encoded word with charset '" << charset << "' left in its raw form");

                decoded_output->insert(decoded_output->end(), word.begin(), word.end());
                ptr = word_end;
        }
}

} //end namespace Mime
} //end namespace Dispo
