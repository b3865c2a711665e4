#ifndef dispo_unicode
#define dispo_unicode

#ifndef dispo_dispolib
#include "dispolib.h"
#endif

#include <algorithm>
#include <vector>

namespace Dispo
{

///32-bit Unicode string. Also used for byte strings that still have to be decoded (every unit <= 255)
typedef std::vector<uint32_t> UnicodeString;

template <class OutputIterator> class UTF8Encoder
{
        public:
        UTF8Encoder(OutputIterator _output) : output(_output) {}

        void operator() (uint32_t ch)
        {
                if (ch < 128)
                {
                        *output++ = uint8_t(ch);
                }
                else if (ch <= 0x7FF) //2-byte sequence
                {
                        *output++ = uint8_t(0xC0 + ch / (1<<6));
                        *output++ = uint8_t(0x80 + ch % (1<<6));
                }
                else if (ch <= 0xFFFF) //3-byte sequences
                {
                        *output++ = uint8_t(0xE0 + ch / (1<<12));
                        *output++ = uint8_t(0x80 + (ch / (1<<6)) % (1<<6));
                        *output++ = uint8_t(0x80 + ch % (1<<6));
                }
                else if (ch <= 0x10FFFF) //4-byte sequence
                {
                        *output++ = uint8_t(0xF0 + ch / (1<<18));
                        *output++ = uint8_t(0x80 + (ch / (1<<12)) % (1<<6));
                        *output++ = uint8_t(0x80 + (ch / (1<<6)) % (1<<6));
                        *output++ = uint8_t(0x80 + ch % (1<<6));
                }
                else //not representable, emit U+FFFD
                {
                        operator()(uint32_t(0xFFFD));
                }
        }

        //Ensure safe upcasting of signed types (ie, don't convert char 166 to -90 before doing further conversion)
        void operator() (signed char ch) { operator() (uint32_t(static_cast<unsigned char>(ch))); }
        void operator() (unsigned char ch){ operator() (uint32_t(ch)); }
        void operator() (char ch)        { operator() (uint32_t(static_cast<unsigned char>(ch))); }
        void operator() (int ch)         { operator() (uint32_t(static_cast<unsigned int>(ch))); }

        OutputIterator output;
};

template <class OutputIterator, class InputIterator>
  OutputIterator UTF8Encode(InputIterator begin,InputIterator end, OutputIterator output)
{
        UTF8Encoder<OutputIterator> encoder(output);
        for(;begin!=end;++begin)
            encoder(*begin);
        return encoder.output;
}

/** A class to process and decode UTF-8 characters to Unicode characters.
    Decoding is strict: overlong forms, encoded surrogates and code points
    above U+10FFFF are reported as InvalidChar. The byte that exposes an
    invalid sequence is consumed. */
class DISPOLIB_PUBLIC UTF8DecodeMachine
{
        ///Number of continuation bytes the current character still needs
        unsigned bytes_needed;
        ///Code point bits collected so far
        uint32_t code_point;
        ///Lowest acceptable value for the next continuation byte
        uint8_t lower_boundary;
        ///Highest acceptable value for the next continuation byte
        uint8_t upper_boundary;

        uint32_t ComplexDecode(uint8_t byte);

        public:
        static const uint32_t NoChar = 0xFFFFFFFF;
        static const uint32_t InvalidChar = 0xFFFFFFFE;

        ///Initialize a decoder
        UTF8DecodeMachine() : bytes_needed(0), code_point(0), lower_boundary(0x80), upper_boundary(0xBF) {  }

        /** Is the UTF8 machine busy processing a character? */
        bool InsideCharacter() const { return bytes_needed > 0; }

        /** Process a UTF8 coded character
            @return NoChar if there is no output yet, InvalidChar if the sequence is broken, the current (unicode) character otherwise */
        uint32_t operator() (uint8_t inputbyte)
        {
                if (bytes_needed==0 && inputbyte<128) //simple sequence
                    return inputbyte;
                else
                    return ComplexDecode(inputbyte);
        }
};

/** Check whether a byte string is valid (strict) UTF-8 */
template <typename Itr>
  bool IsValidUTF8(Itr begin, Itr end)
{
        UTF8DecodeMachine checker;
        for (;begin!=end;++begin)
        {
                uint32_t decoded = checker(uint8_t(*begin));
                if(decoded == UTF8DecodeMachine::InvalidChar)
                        return false;
        }
        return checker.InsideCharacter() == false; //not halfway inside a character ?
}

///Supported character sets: the encodings browsers decode
namespace Charsets
{
        enum Charset
        {
                ///Unknown character set (used as error codes)
                Unknown=0,
                ///UTF-8
                UTF8,
                ///UTF-16, little endian
                UTF16LE,
                ///UTF-16, big endian
                UTF16BE,
                ///DOS Cyrillic
                IBM866,
                ///Central Europe
                Iso8859_2,
                ///South Europe
                Iso8859_3,
                ///North Europe
                Iso8859_4,
                ///Cyrillic
                Iso8859_5,
                ///Arabic
                Iso8859_6,
                ///Greek
                Iso8859_7,
                ///Hebrew, also used for the logical order ISO-8859-8-I labels
                Iso8859_8,
                ///Nordic
                Iso8859_10,
                ///Baltic
                Iso8859_13,
                ///Celtic
                Iso8859_14,
                ///ISO-8859-15 (Latin-9) character set
                Iso8859_15,
                ///South-Eastern Europe
                Iso8859_16,
                ///Russian
                KOI8R,
                ///Ukrainian
                KOI8U,
                ///Mac OS Roman
                Macintosh,
                ///Thai
                CP874,
                ///Central Europe
                CP1250,
                ///Cyrillic
                CP1251,
                ///Windows Codepage 1252 (extended latin-1, also used for ISO-8859-1 and US-ASCII labels)
                CP1252,
                ///Greek
                CP1253,
                ///Turkish (also used for ISO-8859-9 labels)
                CP1254,
                ///Hebrew
                CP1255,
                ///Windows Codepage 1256 (arabic)
                CP1256,
                ///Baltic
                CP1257,
                ///Vietnam
                CP1258,
                ///Mac OS Cyrillic
                MacCyrillic,
                ///Simplified Chinese, decoded as GB18030
                GBK,
                ///Simplified Chinese
                GB18030,
                ///Traditional Chinese, with the HKSCS extensions
                Big5,
                ///Japanese
                EUCJP,
                ///Japanese, 7 bit
                ISO2022JP,
                ///Japanese (Windows code page 932)
                ShiftJIS,
                ///Korean (Windows code page 949)
                EUCKR,
                ///Bytes 0x80-0xFF mapped to U+F780-U+F7FF
                UserDefined
        };
} //end namespace charsets

/** @short Get the name for a character set */
DISPOLIB_PUBLIC char const * GetCharsetName(Charsets::Charset page);

/** @short Given a label, find a matching character set. Labels are compared
           case-insensitively, ignoring surrounding whitespace, against the
           labels browsers accept for the encoding
    @param start Start of character set name
    @param end End of character set name
    @return The character set, or Unknown if the charset name was unrecognized */
DISPOLIB_PUBLIC Charsets::Charset FindCharacterset(const char *start, const char *end);

inline Charsets::Charset FindCharacterset(std::string const &label)
{
        return FindCharacterset(label.data(), label.data() + label.size());
}

/** Get the built-in table for a codepage.
    @param page requested codepage
    @return Codepage contents (a 256-uint32_t array), or NULL if the character set is not decoded through a table
            of our own (UTF-8, UTF-16 and the sets converted by ICU) */
DISPOLIB_PUBLIC uint32_t const * GetCharsetConversiontable(Charsets::Charset page);

/** Strictly decode bytes in the specified character set. A leading byte
    order mark matching a UTF-8 or UTF-16 character set is skipped. UTF-8,
    UTF-16, windows-1251, windows-1252, ISO-8859-15 and x-user-defined are
    decoded here, all other character sets through an ICU converter.
    @param start Start of the bytes to decode
    @param end End of the bytes to decode
    @param page Character set to decode from
    @param output Receives the decoded characters (cleared first). Undefined if the decoding failed
    @return false if the character set is unknown or the bytes are not valid in it */
DISPOLIB_PUBLIC bool ConvertCharsetToUnicode(const uint8_t *start, const uint8_t *end, Charsets::Charset page, UnicodeString *output);

/** Encode 16-bit code units to UTF-8. Surrogate pairs are combined, unpaired
    surrogates are replaced by U+FFFD */
DISPOLIB_PUBLIC std::string EncodeUTF8(UnicodeString const &text);

} //end namespace Dispo

#endif /* sentry */
