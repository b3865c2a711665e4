#include <dispo/dispolib.h>

#include "unicode.h"

#include <unicode/ucnv.h>
#include <unicode/utf16.h>
#include <unicode/utypes.h>

namespace Dispo
{

uint32_t UTF8DecodeMachine::ComplexDecode(uint8_t byte)
{
        if (bytes_needed == 0)
        {
                if (byte >= 0xC2 && byte <= 0xDF)
                {
                        bytes_needed = 1;
                        code_point = byte & 0x1F;
                }
                else if (byte >= 0xE0 && byte <= 0xEF)
                {
                        if (byte == 0xE0)
                            lower_boundary = 0xA0; //overlong
                        else if (byte == 0xED)
                            upper_boundary = 0x9F; //surrogates
                        bytes_needed = 2;
                        code_point = byte & 0x0F;
                }
                else if (byte >= 0xF0 && byte <= 0xF4)
                {
                        if (byte == 0xF0)
                            lower_boundary = 0x90; //overlong
                        else if (byte == 0xF4)
                            upper_boundary = 0x8F; //above U+10FFFF
                        bytes_needed = 3;
                        code_point = byte & 0x07;
                }
                else
                {
                        return InvalidChar; //stray continuation byte, or a lead byte that can't start a valid sequence
                }
                return NoChar;
        }

        if (byte < lower_boundary || byte > upper_boundary)
        {
                *this = UTF8DecodeMachine();
                return InvalidChar;
        }

        lower_boundary = 0x80;
        upper_boundary = 0xBF;
        code_point = (code_point << 6) | (byte & 0x3F);
        if (--bytes_needed > 0)
            return NoChar;

        uint32_t retval = code_point;
        code_point = 0;
        return retval;
}

namespace
{

struct CharsetLabel
{
        const char *label;
        Charsets::Charset charset;
};

//Labels as accepted by browsers. The labels of the 'replacement' encoding (iso-2022-kr, hz-gb-2312, ...) have no decoder and are not listed
const CharsetLabel charset_labels[] =
{ { "unicode-1-1-utf-8", Charsets::UTF8 }
, { "unicode11utf8", Charsets::UTF8 }
, { "unicode20utf8", Charsets::UTF8 }
, { "utf-8", Charsets::UTF8 }
, { "utf8", Charsets::UTF8 }
, { "x-unicode20utf8", Charsets::UTF8 }

, { "csunicode", Charsets::UTF16LE }
, { "iso-10646-ucs-2", Charsets::UTF16LE }
, { "ucs-2", Charsets::UTF16LE }
, { "unicode", Charsets::UTF16LE }
, { "unicodefeff", Charsets::UTF16LE }
, { "utf-16", Charsets::UTF16LE }
, { "utf-16le", Charsets::UTF16LE }

, { "unicodefffe", Charsets::UTF16BE }
, { "utf-16be", Charsets::UTF16BE }

, { "866", Charsets::IBM866 }
, { "cp866", Charsets::IBM866 }
, { "csibm866", Charsets::IBM866 }
, { "ibm866", Charsets::IBM866 }

, { "csisolatin2", Charsets::Iso8859_2 }
, { "iso-8859-2", Charsets::Iso8859_2 }
, { "iso-ir-101", Charsets::Iso8859_2 }
, { "iso8859-2", Charsets::Iso8859_2 }
, { "iso88592", Charsets::Iso8859_2 }
, { "iso_8859-2", Charsets::Iso8859_2 }
, { "iso_8859-2:1987", Charsets::Iso8859_2 }
, { "l2", Charsets::Iso8859_2 }
, { "latin2", Charsets::Iso8859_2 }

, { "csisolatin3", Charsets::Iso8859_3 }
, { "iso-8859-3", Charsets::Iso8859_3 }
, { "iso-ir-109", Charsets::Iso8859_3 }
, { "iso8859-3", Charsets::Iso8859_3 }
, { "iso88593", Charsets::Iso8859_3 }
, { "iso_8859-3", Charsets::Iso8859_3 }
, { "iso_8859-3:1988", Charsets::Iso8859_3 }
, { "l3", Charsets::Iso8859_3 }
, { "latin3", Charsets::Iso8859_3 }

, { "csisolatin4", Charsets::Iso8859_4 }
, { "iso-8859-4", Charsets::Iso8859_4 }
, { "iso-ir-110", Charsets::Iso8859_4 }
, { "iso8859-4", Charsets::Iso8859_4 }
, { "iso88594", Charsets::Iso8859_4 }
, { "iso_8859-4", Charsets::Iso8859_4 }
, { "iso_8859-4:1988", Charsets::Iso8859_4 }
, { "l4", Charsets::Iso8859_4 }
, { "latin4", Charsets::Iso8859_4 }

, { "csisolatincyrillic", Charsets::Iso8859_5 }
, { "cyrillic", Charsets::Iso8859_5 }
, { "iso-8859-5", Charsets::Iso8859_5 }
, { "iso-ir-144", Charsets::Iso8859_5 }
, { "iso8859-5", Charsets::Iso8859_5 }
, { "iso88595", Charsets::Iso8859_5 }
, { "iso_8859-5", Charsets::Iso8859_5 }
, { "iso_8859-5:1988", Charsets::Iso8859_5 }

, { "arabic", Charsets::Iso8859_6 }
, { "asmo-708", Charsets::Iso8859_6 }
, { "csiso88596e", Charsets::Iso8859_6 }
, { "csiso88596i", Charsets::Iso8859_6 }
, { "csisolatinarabic", Charsets::Iso8859_6 }
, { "ecma-114", Charsets::Iso8859_6 }
, { "iso-8859-6", Charsets::Iso8859_6 }
, { "iso-8859-6-e", Charsets::Iso8859_6 }
, { "iso-8859-6-i", Charsets::Iso8859_6 }
, { "iso-ir-127", Charsets::Iso8859_6 }
, { "iso8859-6", Charsets::Iso8859_6 }
, { "iso88596", Charsets::Iso8859_6 }
, { "iso_8859-6", Charsets::Iso8859_6 }
, { "iso_8859-6:1987", Charsets::Iso8859_6 }

, { "csisolatingreek", Charsets::Iso8859_7 }
, { "ecma-118", Charsets::Iso8859_7 }
, { "elot_928", Charsets::Iso8859_7 }
, { "greek", Charsets::Iso8859_7 }
, { "greek8", Charsets::Iso8859_7 }
, { "iso-8859-7", Charsets::Iso8859_7 }
, { "iso-ir-126", Charsets::Iso8859_7 }
, { "iso8859-7", Charsets::Iso8859_7 }
, { "iso88597", Charsets::Iso8859_7 }
, { "iso_8859-7", Charsets::Iso8859_7 }
, { "iso_8859-7:1987", Charsets::Iso8859_7 }
, { "sun_eu_greek", Charsets::Iso8859_7 }

, { "csiso88598e", Charsets::Iso8859_8 }
, { "csisolatinhebrew", Charsets::Iso8859_8 }
, { "hebrew", Charsets::Iso8859_8 }
, { "iso-8859-8", Charsets::Iso8859_8 }
, { "iso-8859-8-e", Charsets::Iso8859_8 }
, { "iso-ir-138", Charsets::Iso8859_8 }
, { "iso8859-8", Charsets::Iso8859_8 }
, { "iso88598", Charsets::Iso8859_8 }
, { "iso_8859-8", Charsets::Iso8859_8 }
, { "iso_8859-8:1988", Charsets::Iso8859_8 }
, { "visual", Charsets::Iso8859_8 }
, { "csiso88598i", Charsets::Iso8859_8 }
, { "iso-8859-8-i", Charsets::Iso8859_8 }
, { "logical", Charsets::Iso8859_8 }

, { "csisolatin6", Charsets::Iso8859_10 }
, { "iso-8859-10", Charsets::Iso8859_10 }
, { "iso-ir-157", Charsets::Iso8859_10 }
, { "iso8859-10", Charsets::Iso8859_10 }
, { "iso885910", Charsets::Iso8859_10 }
, { "l6", Charsets::Iso8859_10 }
, { "latin6", Charsets::Iso8859_10 }

, { "iso-8859-13", Charsets::Iso8859_13 }
, { "iso8859-13", Charsets::Iso8859_13 }
, { "iso885913", Charsets::Iso8859_13 }

, { "iso-8859-14", Charsets::Iso8859_14 }
, { "iso8859-14", Charsets::Iso8859_14 }
, { "iso885914", Charsets::Iso8859_14 }

, { "csisolatin9", Charsets::Iso8859_15 }
, { "iso-8859-15", Charsets::Iso8859_15 }
, { "iso8859-15", Charsets::Iso8859_15 }
, { "iso885915", Charsets::Iso8859_15 }
, { "iso_8859-15", Charsets::Iso8859_15 }
, { "l9", Charsets::Iso8859_15 }

, { "iso-8859-16", Charsets::Iso8859_16 }

, { "cskoi8r", Charsets::KOI8R }
, { "koi", Charsets::KOI8R }
, { "koi8", Charsets::KOI8R }
, { "koi8-r", Charsets::KOI8R }
, { "koi8_r", Charsets::KOI8R }

, { "koi8-ru", Charsets::KOI8U }
, { "koi8-u", Charsets::KOI8U }

, { "csmacintosh", Charsets::Macintosh }
, { "mac", Charsets::Macintosh }
, { "macintosh", Charsets::Macintosh }
, { "x-mac-roman", Charsets::Macintosh }

, { "dos-874", Charsets::CP874 }
, { "iso-8859-11", Charsets::CP874 }
, { "iso8859-11", Charsets::CP874 }
, { "iso885911", Charsets::CP874 }
, { "tis-620", Charsets::CP874 }
, { "windows-874", Charsets::CP874 }

, { "cp1250", Charsets::CP1250 }
, { "windows-1250", Charsets::CP1250 }
, { "x-cp1250", Charsets::CP1250 }

, { "cp1251", Charsets::CP1251 }
, { "windows-1251", Charsets::CP1251 }
, { "x-cp1251", Charsets::CP1251 }

, { "ansi_x3.4-1968", Charsets::CP1252 }
, { "ascii", Charsets::CP1252 }
, { "cp1252", Charsets::CP1252 }
, { "cp819", Charsets::CP1252 }
, { "csisolatin1", Charsets::CP1252 }
, { "ibm819", Charsets::CP1252 }
, { "iso-8859-1", Charsets::CP1252 }
, { "iso-ir-100", Charsets::CP1252 }
, { "iso8859-1", Charsets::CP1252 }
, { "iso88591", Charsets::CP1252 }
, { "iso_8859-1", Charsets::CP1252 }
, { "iso_8859-1:1987", Charsets::CP1252 }
, { "l1", Charsets::CP1252 }
, { "latin1", Charsets::CP1252 }
, { "us-ascii", Charsets::CP1252 }
, { "windows-1252", Charsets::CP1252 }
, { "x-cp1252", Charsets::CP1252 }

, { "cp1253", Charsets::CP1253 }
, { "windows-1253", Charsets::CP1253 }
, { "x-cp1253", Charsets::CP1253 }

, { "cp1254", Charsets::CP1254 }
, { "csisolatin5", Charsets::CP1254 }
, { "iso-8859-9", Charsets::CP1254 }
, { "iso-ir-148", Charsets::CP1254 }
, { "iso8859-9", Charsets::CP1254 }
, { "iso88599", Charsets::CP1254 }
, { "iso_8859-9", Charsets::CP1254 }
, { "iso_8859-9:1989", Charsets::CP1254 }
, { "l5", Charsets::CP1254 }
, { "latin5", Charsets::CP1254 }
, { "windows-1254", Charsets::CP1254 }
, { "x-cp1254", Charsets::CP1254 }

, { "cp1255", Charsets::CP1255 }
, { "windows-1255", Charsets::CP1255 }
, { "x-cp1255", Charsets::CP1255 }

, { "cp1256", Charsets::CP1256 }
, { "windows-1256", Charsets::CP1256 }
, { "x-cp1256", Charsets::CP1256 }

, { "cp1257", Charsets::CP1257 }
, { "windows-1257", Charsets::CP1257 }
, { "x-cp1257", Charsets::CP1257 }

, { "cp1258", Charsets::CP1258 }
, { "windows-1258", Charsets::CP1258 }
, { "x-cp1258", Charsets::CP1258 }

, { "x-mac-cyrillic", Charsets::MacCyrillic }
, { "x-mac-ukrainian", Charsets::MacCyrillic }

, { "chinese", Charsets::GBK }
, { "csgb2312", Charsets::GBK }
, { "csiso58gb231280", Charsets::GBK }
, { "gb2312", Charsets::GBK }
, { "gb_2312", Charsets::GBK }
, { "gb_2312-80", Charsets::GBK }
, { "gbk", Charsets::GBK }
, { "iso-ir-58", Charsets::GBK }
, { "x-gbk", Charsets::GBK }

, { "gb18030", Charsets::GB18030 }

, { "big5", Charsets::Big5 }
, { "big5-hkscs", Charsets::Big5 }
, { "cn-big5", Charsets::Big5 }
, { "csbig5", Charsets::Big5 }
, { "x-x-big5", Charsets::Big5 }

, { "cseucpkdfmtjapanese", Charsets::EUCJP }
, { "euc-jp", Charsets::EUCJP }
, { "x-euc-jp", Charsets::EUCJP }

, { "csiso2022jp", Charsets::ISO2022JP }
, { "iso-2022-jp", Charsets::ISO2022JP }

, { "csshiftjis", Charsets::ShiftJIS }
, { "ms932", Charsets::ShiftJIS }
, { "ms_kanji", Charsets::ShiftJIS }
, { "shift-jis", Charsets::ShiftJIS }
, { "shift_jis", Charsets::ShiftJIS }
, { "sjis", Charsets::ShiftJIS }
, { "windows-31j", Charsets::ShiftJIS }
, { "x-sjis", Charsets::ShiftJIS }

, { "cseuckr", Charsets::EUCKR }
, { "csksc56011987", Charsets::EUCKR }
, { "euc-kr", Charsets::EUCKR }
, { "iso-ir-149", Charsets::EUCKR }
, { "korean", Charsets::EUCKR }
, { "ks_c_5601-1987", Charsets::EUCKR }
, { "ks_c_5601-1989", Charsets::EUCKR }
, { "ksc5601", Charsets::EUCKR }
, { "ksc_5601", Charsets::EUCKR }
, { "windows-949", Charsets::EUCKR }

, { "x-user-defined", Charsets::UserDefined }
};

struct CharsetInfo
{
        Charsets::Charset charset;
        ///Canonical name
        const char *name;
        ///ICU converter doing the decoding, NULL if decoded by ourselves
        const char *converter;
};

const CharsetInfo charset_info[] =
{ { Charsets::UTF8,        "utf-8",          NULL }
, { Charsets::UTF16LE,     "utf-16le",       NULL }
, { Charsets::UTF16BE,     "utf-16be",       NULL }
, { Charsets::IBM866,      "ibm866",         "IBM866" }
, { Charsets::Iso8859_2,   "iso-8859-2",     "ISO-8859-2" }
, { Charsets::Iso8859_3,   "iso-8859-3",     "ISO-8859-3" }
, { Charsets::Iso8859_4,   "iso-8859-4",     "ISO-8859-4" }
, { Charsets::Iso8859_5,   "iso-8859-5",     "ISO-8859-5" }
, { Charsets::Iso8859_6,   "iso-8859-6",     "ISO-8859-6" }
, { Charsets::Iso8859_7,   "iso-8859-7",     "ISO-8859-7" }
, { Charsets::Iso8859_8,   "iso-8859-8",     "ISO-8859-8" }
, { Charsets::Iso8859_10,  "iso-8859-10",    "ISO-8859-10" }
, { Charsets::Iso8859_13,  "iso-8859-13",    "ISO-8859-13" }
, { Charsets::Iso8859_14,  "iso-8859-14",    "ISO-8859-14" }
, { Charsets::Iso8859_15,  "iso-8859-15",    NULL }
, { Charsets::Iso8859_16,  "iso-8859-16",    "ISO-8859-16" }
, { Charsets::KOI8R,       "koi8-r",         "KOI8-R" }
, { Charsets::KOI8U,       "koi8-u",         "KOI8-U" }
, { Charsets::Macintosh,   "macintosh",      "macintosh" }
, { Charsets::CP874,       "windows-874",    "windows-874" }
, { Charsets::CP1250,      "windows-1250",   "windows-1250" }
, { Charsets::CP1251,      "windows-1251",   NULL }
, { Charsets::CP1252,      "windows-1252",   NULL }
, { Charsets::CP1253,      "windows-1253",   "windows-1253" }
, { Charsets::CP1254,      "windows-1254",   "windows-1254" }
, { Charsets::CP1255,      "windows-1255",   "windows-1255" }
, { Charsets::CP1256,      "windows-1256",   "windows-1256" }
, { Charsets::CP1257,      "windows-1257",   "windows-1257" }
, { Charsets::CP1258,      "windows-1258",   "windows-1258" }
, { Charsets::MacCyrillic, "x-mac-cyrillic", "x-mac-cyrillic" }
, { Charsets::GBK,         "gbk",            "GB18030" }
, { Charsets::GB18030,     "gb18030",        "GB18030" }
, { Charsets::Big5,        "big5",           "Big5-HKSCS" }
, { Charsets::EUCJP,       "euc-jp",         "EUC-JP" }
, { Charsets::ISO2022JP,   "iso-2022-jp",    "ISO-2022-JP" }
, { Charsets::ShiftJIS,    "shift_jis",      "windows-31j" }
, { Charsets::EUCKR,       "euc-kr",         "windows-949" }
, { Charsets::UserDefined, "x-user-defined", NULL }
};

CharsetInfo const * FindCharsetInfo(Charsets::Charset page)
{
        for (CharsetInfo const &info : charset_info)
            if (info.charset == page)
                return &info;
        return NULL;
}

//Upper halves of the single byte character sets. Lower halves are ASCII
const uint16_t cp1252_80_9f[32] =
{ 0x20AC,0x0081,0x201A,0x0192,0x201E,0x2026,0x2020,0x2021,0x02C6,0x2030,0x0160,0x2039,0x0152,0x008D,0x017D,0x008F
, 0x0090,0x2018,0x2019,0x201C,0x201D,0x2022,0x2013,0x2014,0x02DC,0x2122,0x0161,0x203A,0x0153,0x009D,0x017E,0x0178
};

const uint16_t cp1251_80_bf[64] =
{ 0x0402,0x0403,0x201A,0x0453,0x201E,0x2026,0x2020,0x2021,0x20AC,0x2030,0x0409,0x2039,0x040A,0x040C,0x040B,0x040F
, 0x0452,0x2018,0x2019,0x201C,0x201D,0x2022,0x2013,0x2014,0x0098,0x2122,0x0459,0x203A,0x045A,0x045C,0x045B,0x045F
, 0x00A0,0x040E,0x045E,0x0408,0x00A4,0x0490,0x00A6,0x00A7,0x0401,0x00A9,0x0404,0x00AB,0x00AC,0x00AD,0x00AE,0x0407
, 0x00B0,0x00B1,0x0406,0x0456,0x0491,0x00B5,0x00B6,0x00B7,0x0451,0x2116,0x0454,0x00BB,0x0458,0x0405,0x0455,0x0457
};

//Positions where ISO-8859-15 differs from ISO-8859-1
const uint16_t iso8859_15_changes[8][2] =
{ { 0xA4, 0x20AC }, { 0xA6, 0x0160 }, { 0xA8, 0x0161 }, { 0xB4, 0x017D }
, { 0xB8, 0x017E }, { 0xBC, 0x0152 }, { 0xBD, 0x0153 }, { 0xBE, 0x0178 }
};

struct CodepageTable
{
        uint32_t chars[256];

        CodepageTable()
        {
                for (unsigned i=0;i<256;++i)
                    chars[i]=i;
        }
};

CodepageTable const & GetCP1252()
{
        static CodepageTable const table = []()
        {
                CodepageTable cp;
                for (unsigned i=0;i<32;++i)
                    cp.chars[0x80+i] = cp1252_80_9f[i];
                return cp;
        }();
        return table;
}

CodepageTable const & GetCP1251()
{
        static CodepageTable const table = []()
        {
                CodepageTable cp;
                for (unsigned i=0;i<64;++i)
                    cp.chars[0x80+i] = cp1251_80_bf[i];
                for (unsigned i=0xC0;i<0x100;++i)
                    cp.chars[i] = 0x0410 + (i-0xC0); //А through я
                return cp;
        }();
        return table;
}

CodepageTable const & GetIso8859_15()
{
        static CodepageTable const table = []()
        {
                CodepageTable cp;
                for (unsigned i=0;i<8;++i)
                    cp.chars[iso8859_15_changes[i][0]] = iso8859_15_changes[i][1];
                return cp;
        }();
        return table;
}

CodepageTable const & GetUserDefined()
{
        static CodepageTable const table = []()
        {
                CodepageTable cp;
                for (unsigned i=0x80;i<0x100;++i)
                    cp.chars[i] = 0xF780 + (i-0x80);
                return cp;
        }();
        return table;
}

inline bool IsHighSurrogate(uint32_t ch) { return ch>=0xD800 && ch<=0xDBFF; }
inline bool IsLowSurrogate(uint32_t ch) { return ch>=0xDC00 && ch<=0xDFFF; }

bool DecodeUTF8(const uint8_t *start, const uint8_t *end, UnicodeString *output)
{
        if (end-start >= 3 && start[0]==0xEF && start[1]==0xBB && start[2]==0xBF)
            start += 3;

        UTF8DecodeMachine decoder;
        for (;start!=end;++start)
        {
                uint32_t ch = decoder(*start);
                if (ch == UTF8DecodeMachine::InvalidChar)
                    return false;
                if (ch != UTF8DecodeMachine::NoChar)
                    output->push_back(ch);
        }
        return !decoder.InsideCharacter();
}

bool DecodeUTF16(const uint8_t *start, const uint8_t *end, bool bigendian, UnicodeString *output)
{
        if ((end-start) % 2 != 0)
            return false;

        if (end-start >= 2)
        {
                if ((bigendian && start[0]==0xFE && start[1]==0xFF)
                    || (!bigendian && start[0]==0xFF && start[1]==0xFE))
                    start += 2;
        }

        uint32_t pending_high = 0;
        for (;start!=end;start+=2)
        {
                uint32_t unit = bigendian ? (uint32_t(start[0])<<8) | start[1]
                                          : (uint32_t(start[1])<<8) | start[0];
                if (pending_high)
                {
                        if (!IsLowSurrogate(unit))
                            return false;
                        output->push_back(0x10000 + ((pending_high - 0xD800) << 10) + (unit - 0xDC00));
                        pending_high = 0;
                }
                else if (IsHighSurrogate(unit))
                {
                        pending_high = unit;
                }
                else if (IsLowSurrogate(unit))
                {
                        return false;
                }
                else
                {
                        output->push_back(unit);
                }
        }
        return pending_high == 0;
}

struct ConverterCloser
{
        void operator()(UConverter *converter) const { ucnv_close(converter); }
};

/* Decode through an ICU converter, failing on the first byte sequence the converter can't map */
bool DecodeWithConverter(const char *convertername, const uint8_t *start, const uint8_t *end, UnicodeString *output)
{
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<UConverter, ConverterCloser> converter(ucnv_open(convertername, &status));
        if (U_FAILURE(status))
        {
                DEBUGPRINT("ICU has no converter '" << convertername << "': " << u_errorName(status));
                return false;
        }

        ucnv_setToUCallBack(converter.get(), UCNV_TO_U_CALLBACK_STOP, NULL, NULL, NULL, &status);
        if (U_FAILURE(status))
            return false;

        //No converter produces more than two UTF-16 units per input byte
        int32_t capacity = int32_t(end-start) * 2 + 1;
        std::vector<UChar> units(capacity);
        int32_t length = ucnv_toUChars(converter.get(), &units[0], capacity, reinterpret_cast<const char*>(start), int32_t(end-start), &status);
        if (U_FAILURE(status))
            return false;

        output->reserve(length);
        for (int32_t pos = 0; pos < length; )
        {
                UChar32 ch;
                U16_NEXT(&units[0], pos, length, ch);
                output->push_back(uint32_t(ch));
        }
        return true;
}

} //end anonymous namespace

char const * GetCharsetName(Charsets::Charset page)
{
        CharsetInfo const *info = FindCharsetInfo(page);
        return info ? info->name : "unknown";
}

Charsets::Charset FindCharacterset(const char *start, const char *end)
{
        //Labels are matched after trimming ASCII whitespace
        while (start!=end && (*start==' ' || *start=='\t' || *start=='\n' || *start=='\f' || *start=='\r'))
            ++start;
        while (start!=end && (end[-1]==' ' || end[-1]=='\t' || end[-1]=='\n' || end[-1]=='\f' || end[-1]=='\r'))
            --end;

        for (CharsetLabel const &entry : charset_labels)
        {
                const char *label_end = entry.label + std::strlen(entry.label);
                if (StrCaseCompare(start, end, entry.label, label_end) == 0)
                    return entry.charset;
        }
        return Charsets::Unknown;
}

uint32_t const * GetCharsetConversiontable(Charsets::Charset page)
{
        switch (page)
        {
        case Charsets::CP1252:     return GetCP1252().chars;
        case Charsets::CP1251:     return GetCP1251().chars;
        case Charsets::Iso8859_15: return GetIso8859_15().chars;
        case Charsets::UserDefined: return GetUserDefined().chars;
        default:                   return nullptr;
        }
}

bool ConvertCharsetToUnicode(const uint8_t *start, const uint8_t *end, Charsets::Charset page, UnicodeString *output)
{
        output->clear();
        switch (page)
        {
        case Charsets::UTF8:
                return DecodeUTF8(start, end, output);
        case Charsets::UTF16LE:
                return DecodeUTF16(start, end, false, output);
        case Charsets::UTF16BE:
                return DecodeUTF16(start, end, true, output);
        default:
                break;
        }

        uint32_t const *table = GetCharsetConversiontable(page);
        if (!table)
        {
                CharsetInfo const *info = FindCharsetInfo(page);
                return info && info->converter && DecodeWithConverter(info->converter, start, end, output);
        }

        output->reserve(end-start);
        for (;start!=end;++start)
            output->push_back(table[*start]);
        return true;
}

std::string EncodeUTF8(UnicodeString const &text)
{
        std::string retval;
        retval.reserve(text.size());
        UTF8Encoder<std::back_insert_iterator<std::string> > encoder(std::back_inserter(retval));

        for (UnicodeString::const_iterator itr = text.begin(); itr != text.end(); ++itr)
        {
                uint32_t ch = *itr;
                if (IsHighSurrogate(ch) && itr + 1 != text.end() && IsLowSurrogate(itr[1]))
                {
                        ++itr;
                        encoder(uint32_t(0x10000 + ((ch - 0xD800) << 10) + (*itr - 0xDC00)));
                }
                else if (IsHighSurrogate(ch) || IsLowSurrogate(ch))
                {
                        encoder(uint32_t(0xFFFD));
                }
                else
                {
                        encoder(ch);
                }
        }
        return retval;
}

} //end namespace Dispo
