//---------------------------------------------------------------------------
#include <dispo/dispolib.h>
#include <iostream>
#include <string>
#include <vector>
#include "../testing.h"

//---------------------------------------------------------------------------

#include "../mime.h"

namespace
{

/* Printable form of a code unit string, non-ASCII units are written as \uXXXX */
std::string Dump(Dispo::UnicodeString const &text)
{
        std::string retval;
        for (Dispo::UnicodeString::const_iterator itr = text.begin(); itr != text.end(); ++itr)
        {
                if (*itr >= 0x20 && *itr < 0x7F && *itr != '\\')
                {
                        retval.push_back(char(*itr));
                        continue;
                }
                std::string digits;
                Dispo::EncodeNumber(*itr, 16, std::back_inserter(digits));
                retval += "\\u";
                retval.append(digits.size() < 4 ? 4 - digits.size() : 0, '0');
                retval += digits;
        }
        return retval;
}

std::string ParamValue(std::string const &header, Dispo::Mime::FilenameParam const &param)
{
        return header.substr(param.start_value, param.end_value - param.start_value);
}

/* Charset decoder for the encoded word tests, remembers the charsets it was asked for */
struct RecordingDecoder
{
        std::vector<std::string> charsets;

        bool operator()(std::string const &charset, Dispo::UnicodeString *value)
        {
                charsets.push_back(charset);

                Dispo::Charsets::Charset page = Dispo::FindCharacterset(charset);
                std::string bytes(value->begin(), value->end());
                Dispo::UnicodeString decoded;
                if (page == Dispo::Charsets::Unknown
                    || !Dispo::ConvertCharsetToUnicode(reinterpret_cast<const uint8_t*>(bytes.data()), reinterpret_cast<const uint8_t*>(bytes.data() + bytes.size()), page, &decoded))
                    return false;
                value->swap(decoded);
                return true;
        }
};

std::string DecodeWords(std::string const &value, RecordingDecoder *decoder)
{
        Dispo::UnicodeString output;
        Dispo::Mime::DecodeEncodedWords(Dispo::Mime::WidenLatin1(value),
                                        [decoder](std::string const &charset, Dispo::UnicodeString *text) { return (*decoder)(charset, text); },
                                        &output);
        return Dump(output);
}

std::string DecodeWords(std::string const &value)
{
        RecordingDecoder decoder;
        return DecodeWords(value, &decoder);
}

std::string QDecode(std::string const &text)
{
        Dispo::UnicodeString output;
        Dispo::Mime::QuotedPrintableDecoder< std::back_insert_iterator< Dispo::UnicodeString > > decoder(std::back_inserter(output));
        for (std::string::const_iterator itr = text.begin(); itr != text.end(); ++itr)
            decoder(uint32_t(uint8_t(*itr)));
        decoder.Finish();
        return Dump(output);
}

} //end anonymous namespace

DISPO_TEST_FUNCTION(FindPlainParameterTest)
{
        Dispo::Mime::FilenameParam param;
        std::string header = "attachment; filename=\"a.pdf\"; size=1";

        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(21u, param.start_value);
        DISPO_TEST_CHECKEQUAL(28u, param.end_value);
        DISPO_TEST_CHECKEQUAL(std::string("\"a.pdf\""), ParamValue(header, param));

        //At the start of the header, and with whitespace around the '='
        header = "filename = report.pdf ;x=y";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("report.pdf"), ParamValue(header, param));

        //Case-insensitive name
        header = "inline;FileName=x.pdf";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("x.pdf"), ParamValue(header, param));

        //Not after something other than a ';'
        DISPO_TEST_CHECK(!Dispo::Mime::FindFilenameParameter("attachment filename=a.pdf", 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECK(!Dispo::Mime::FindFilenameParameter("attachment; myfilename=a.pdf", 0, Dispo::Mime::PlainForm, &param));
        //The extended form is not a plain parameter
        DISPO_TEST_CHECK(!Dispo::Mime::FindFilenameParameter("attachment; filename*=UTF-8''a.pdf", 0, Dispo::Mime::PlainForm, &param));

        //Semicolons inside a quoted value
        header = "attachment; filename=\"a;b.pdf\"";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("\"a;b.pdf\""), ParamValue(header, param));

        //Unterminated quoted string runs to the end
        header = "attachment; filename=\"a b.pdf";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("\"a b.pdf"), ParamValue(header, param));

        //An escaped quote doesn't end the value
        header = "attachment; filename=\"a\\\"b.pdf\"; x";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("\"a\\\"b.pdf\""), ParamValue(header, param));

        //Empty values don't count, a later parameter is used
        header = "attachment; filename=; filename=\"\"; filename=b.pdf";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("b.pdf"), ParamValue(header, param));
}

DISPO_TEST_FUNCTION(FindParameterFromOffsetTest)
{
        Dispo::Mime::FilenameParam param;
        std::string header = "filename=a.pdf; filename=b.pdf";

        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("a.pdf"), ParamValue(header, param));

        //Continuing behind the first value finds the second one, the start of the header is no longer a candidate
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, param.end_value, Dispo::Mime::PlainForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("b.pdf"), ParamValue(header, param));

        DISPO_TEST_CHECK(!Dispo::Mime::FindFilenameParameter(header, param.end_value, Dispo::Mime::PlainForm, &param));
}

DISPO_TEST_FUNCTION(FindExtendedParameterTest)
{
        Dispo::Mime::FilenameParam param;
        std::string header = "attachment; filename=plain.pdf; filename*=UTF-8''ext.pdf";

        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::ExtendedForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("UTF-8''ext.pdf"), ParamValue(header, param));

        header = "attachment; filename* = \"UTF-8''quoted.pdf\"";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::ExtendedForm, &param));
        DISPO_TEST_CHECKEQUAL(std::string("\"UTF-8''quoted.pdf\""), ParamValue(header, param));

        //Continuations are not the extended form
        DISPO_TEST_CHECK(!Dispo::Mime::FindFilenameParameter("attachment; filename*0=a.pdf", 0, Dispo::Mime::ExtendedForm, &param));
        DISPO_TEST_CHECK(!Dispo::Mime::FindFilenameParameter("attachment; filename=a.pdf", 0, Dispo::Mime::ExtendedForm, &param));
}

DISPO_TEST_FUNCTION(FindContinuationParameterTest)
{
        Dispo::Mime::FilenameParam param;
        std::string header = "attachment; filename*12*=abc";

        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::ContinuationForm, &param));
        DISPO_TEST_CHECKEQUAL(12u, param.index);
        DISPO_TEST_CHECK(param.extended);
        DISPO_TEST_CHECKEQUAL(std::string("abc"), ParamValue(header, param));

        header = "filename*0 = \"x y\"";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::ContinuationForm, &param));
        DISPO_TEST_CHECKEQUAL(0u, param.index);
        DISPO_TEST_CHECK(!param.extended);
        DISPO_TEST_CHECKEQUAL(std::string("\"x y\""), ParamValue(header, param));

        //Leading zeroes are not an index
        DISPO_TEST_CHECK(!Dispo::Mime::FindFilenameParameter("attachment; filename*01=a", 0, Dispo::Mime::ContinuationForm, &param));
        //Nor is an empty one
        DISPO_TEST_CHECK(!Dispo::Mime::FindFilenameParameter("attachment; filename*=a", 0, Dispo::Mime::ContinuationForm, &param));

        //The largest 32 bit index still fits
        header = "attachment; filename*4294967295=a";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::ContinuationForm, &param));
        DISPO_TEST_CHECKEQUAL(4294967295u, param.index);

        //An index that doesn't fit is skipped with its value, even when the value contains a ';'
        header = "attachment; filename*4294967296=\"x; filename*3=no\"; filename*7=yes";
        DISPO_TEST_CHECK(Dispo::Mime::FindFilenameParameter(header, 0, Dispo::Mime::ContinuationForm, &param));
        DISPO_TEST_CHECKEQUAL(7u, param.index);
        DISPO_TEST_CHECKEQUAL(std::string("yes"), ParamValue(header, param));
}

DISPO_TEST_FUNCTION(ContinuationPartsTest)
{
        std::vector<Dispo::Mime::ContinuationPart> parts;

        DISPO_TEST_CHECK(Dispo::Mime::CollectContinuationParts("attachment; filename=a.pdf", &parts));
        DISPO_TEST_CHECKEQUAL(0u, parts.size());

        //Parts are returned in index order
        DISPO_TEST_CHECK(Dispo::Mime::CollectContinuationParts("a; filename*1=b; filename*0*=a; filename*2=\"c\"", &parts));
        DISPO_TEST_CHECKEQUAL(3u, parts.size());
        DISPO_TEST_CHECKEQUAL(0u, parts[0].index);
        DISPO_TEST_CHECK(parts[0].extended);
        DISPO_TEST_CHECKEQUAL(std::string("a"), parts[0].fragment);
        DISPO_TEST_CHECKEQUAL(1u, parts[1].index);
        DISPO_TEST_CHECK(!parts[1].extended);
        DISPO_TEST_CHECKEQUAL(std::string("b"), parts[1].fragment);
        DISPO_TEST_CHECKEQUAL(std::string("\"c\""), parts[2].fragment);

        //A gap ends the sequence
        DISPO_TEST_CHECK(Dispo::Mime::CollectContinuationParts("a; filename*0=a; filename*1=b; filename*3=d", &parts));
        DISPO_TEST_CHECKEQUAL(2u, parts.size());

        //Without a first part there is nothing
        DISPO_TEST_CHECK(Dispo::Mime::CollectContinuationParts("a; filename*1=b; filename*2=c", &parts));
        DISPO_TEST_CHECKEQUAL(0u, parts.size());

        //The first occurrence of an index wins
        DISPO_TEST_CHECK(Dispo::Mime::CollectContinuationParts("a; filename*0=a; filename*1=b; filename*1=x", &parts));
        DISPO_TEST_CHECKEQUAL(2u, parts.size());
        DISPO_TEST_CHECKEQUAL(std::string("b"), parts[1].fragment);

        //...but a second filename*0 invalidates everything
        DISPO_TEST_CHECK(!Dispo::Mime::CollectContinuationParts("a; filename*0=a; filename*1=b; filename*0*=x", &parts));
        DISPO_TEST_CHECKEQUAL(0u, parts.size());
}

DISPO_TEST_FUNCTION(Rfc2616UnquoteTest)
{
        DISPO_TEST_CHECKEQUAL(std::string("plain.pdf"), Dispo::Mime::Rfc2616Unquote("plain.pdf"));
        DISPO_TEST_CHECKEQUAL(std::string("a\"b"), Dispo::Mime::Rfc2616Unquote("a\"b"));
        DISPO_TEST_CHECKEQUAL(std::string(""), Dispo::Mime::Rfc2616Unquote(""));
        DISPO_TEST_CHECKEQUAL(std::string("quoted.pdf"), Dispo::Mime::Rfc2616Unquote("\"quoted.pdf\""));
        DISPO_TEST_CHECKEQUAL(std::string("unterminated.pdf"), Dispo::Mime::Rfc2616Unquote("\"unterminated.pdf"));

        //Escapes
        DISPO_TEST_CHECKEQUAL(std::string("a\"b"), Dispo::Mime::Rfc2616Unquote("\"a\\\"b\""));
        DISPO_TEST_CHECKEQUAL(std::string("a\\b"), Dispo::Mime::Rfc2616Unquote("\"a\\\\b\""));
        DISPO_TEST_CHECKEQUAL(std::string("ab"), Dispo::Mime::Rfc2616Unquote("\"a\\b\""));
        DISPO_TEST_CHECKEQUAL(std::string("\"\""), Dispo::Mime::Rfc2616Unquote("\"\\\"\\\"\""));

        //Escaped line breaks keep their backslash
        DISPO_TEST_CHECKEQUAL(std::string("a\\\r\nb"), Dispo::Mime::Rfc2616Unquote("\"a\\\r\nb\""));

        //A trailing backslash has nothing to escape
        DISPO_TEST_CHECKEQUAL(std::string("a\\"), Dispo::Mime::Rfc2616Unquote("\"a\\"));

        //Everything after the closing quote is dropped
        DISPO_TEST_CHECKEQUAL(std::string("a"), Dispo::Mime::Rfc2616Unquote("\"a\"b\""));
        DISPO_TEST_CHECKEQUAL(std::string("a\"b"), Dispo::Mime::Rfc2616Unquote("\"a\\\"b\"c.pdf"));
}

DISPO_TEST_FUNCTION(PercentUnescapeTest)
{
        DISPO_TEST_CHECKEQUAL(std::string("plain"), Dump(Dispo::Mime::PercentUnescape("plain")));
        DISPO_TEST_CHECKEQUAL(std::string("A b"), Dump(Dispo::Mime::PercentUnescape("%41%20b")));
        DISPO_TEST_CHECKEQUAL(std::string("caf\\u00E9"), Dump(Dispo::Mime::PercentUnescape("caf%e9")));
        DISPO_TEST_CHECKEQUAL(std::string("\\u00C3\\u00A9"), Dump(Dispo::Mime::PercentUnescape("%C3%A9")));

        //%uXXXX gives a 16 bit code unit
        DISPO_TEST_CHECKEQUAL(std::string("\\u20AC.pdf"), Dump(Dispo::Mime::PercentUnescape("%u20ac.pdf")));
        DISPO_TEST_CHECKEQUAL(std::string("\\uD83D\\uDE00"), Dump(Dispo::Mime::PercentUnescape("%uD83D%uDE00")));

        //Incomplete escapes stay
        DISPO_TEST_CHECKEQUAL(std::string("%zz"), Dump(Dispo::Mime::PercentUnescape("%zz")));
        DISPO_TEST_CHECKEQUAL(std::string("%4"), Dump(Dispo::Mime::PercentUnescape("%4")));
        DISPO_TEST_CHECKEQUAL(std::string("%"), Dump(Dispo::Mime::PercentUnescape("%")));
        DISPO_TEST_CHECKEQUAL(std::string("%u12"), Dump(Dispo::Mime::PercentUnescape("%u12")));
        DISPO_TEST_CHECKEQUAL(std::string("%u12G4"), Dump(Dispo::Mime::PercentUnescape("%u12G4")));
        DISPO_TEST_CHECKEQUAL(std::string("100%A"), Dump(Dispo::Mime::PercentUnescape("100%%41")));

        //Raw 8 bit bytes pass as code units
        DISPO_TEST_CHECKEQUAL(std::string("\\u00E9"), Dump(Dispo::Mime::PercentUnescape("\xE9")));
}

DISPO_TEST_FUNCTION(SplitExtValueTest)
{
        std::string charset;
        Dispo::UnicodeString value;

        DISPO_TEST_CHECK(Dispo::Mime::SplitExtValue(Dispo::Mime::WidenLatin1("UTF-8'en'a.pdf"), &charset, &value));
        DISPO_TEST_CHECKEQUAL(std::string("UTF-8"), charset);
        DISPO_TEST_CHECKEQUAL(std::string("a.pdf"), Dump(value));

        DISPO_TEST_CHECK(Dispo::Mime::SplitExtValue(Dispo::Mime::WidenLatin1("iso-8859-1''b.pdf"), &charset, &value));
        DISPO_TEST_CHECKEQUAL(std::string("iso-8859-1"), charset);
        DISPO_TEST_CHECKEQUAL(std::string("b.pdf"), Dump(value));

        //Only a charset, no language separator
        DISPO_TEST_CHECK(Dispo::Mime::SplitExtValue(Dispo::Mime::WidenLatin1("utf-8'c.pdf"), &charset, &value));
        DISPO_TEST_CHECKEQUAL(std::string("utf-8"), charset);
        DISPO_TEST_CHECKEQUAL(std::string("c.pdf"), Dump(value));

        //Quotes after the language belong to the value
        DISPO_TEST_CHECK(Dispo::Mime::SplitExtValue(Dispo::Mime::WidenLatin1("a'b'c'd"), &charset, &value));
        DISPO_TEST_CHECKEQUAL(std::string("a"), charset);
        DISPO_TEST_CHECKEQUAL(std::string("c'd"), Dump(value));

        //Empty charset
        DISPO_TEST_CHECK(Dispo::Mime::SplitExtValue(Dispo::Mime::WidenLatin1("''d.pdf"), &charset, &value));
        DISPO_TEST_CHECKEQUAL(std::string(""), charset);
        DISPO_TEST_CHECKEQUAL(std::string("d.pdf"), Dump(value));

        DISPO_TEST_CHECK(!Dispo::Mime::SplitExtValue(Dispo::Mime::WidenLatin1("e.pdf"), &charset, &value));
}

DISPO_TEST_FUNCTION(QuotedPrintableTest)
{
        DISPO_TEST_CHECKEQUAL(std::string("a b"), QDecode("a_b"));
        DISPO_TEST_CHECKEQUAL(std::string("A"), QDecode("=41"));
        DISPO_TEST_CHECKEQUAL(std::string("\\u00E9t\\u00E9"), QDecode("=E9t=e9"));
        DISPO_TEST_CHECKEQUAL(std::string("_"), QDecode("=5F"));

        //Broken escapes are kept literally
        DISPO_TEST_CHECKEQUAL(std::string("=ZZ"), QDecode("=ZZ"));
        DISPO_TEST_CHECKEQUAL(std::string("=A"), QDecode("==41"));
        DISPO_TEST_CHECKEQUAL(std::string("=4A"), QDecode("=4=41"));
        DISPO_TEST_CHECKEQUAL(std::string("=4"), QDecode("=4"));
        DISPO_TEST_CHECKEQUAL(std::string("a="), QDecode("a="));
}

DISPO_TEST_FUNCTION(EncodedWordTest)
{
        DISPO_TEST_CHECKEQUAL(std::string("a"), DecodeWords("=?iso-8859-1?Q?a?="));
        DISPO_TEST_CHECKEQUAL(std::string("\\u00FBh"), DecodeWords("=?iso-8859-1?q?=FBh?="));
        DISPO_TEST_CHECKEQUAL(std::string("r\\u00E9sum\\u00E9.pdf"), DecodeWords("=?UTF-8?Q?r=C3=A9sum=C3=A9?=.pdf"));
        DISPO_TEST_CHECKEQUAL(std::string("If you can read this"), DecodeWords("=?utf-8?B?SWYgeW91IGNhbiByZWFkIHRoaXM=?="));
        DISPO_TEST_CHECKEQUAL(std::string("If you can read this"), DecodeWords("=?utf-8?b?SWYgeW91IGNhbiByZWFkIHRoaXM?="));

        //Whitespace between words is kept
        DISPO_TEST_CHECKEQUAL(std::string("a b"), DecodeWords("=?utf-8?Q?a?= =?utf-8?Q?b?="));
        DISPO_TEST_CHECKEQUAL(std::string("ab"), DecodeWords("=?utf-8?Q?a?==?utf-8?Q?b?="));

        //Text in between that isn't a complete word
        DISPO_TEST_CHECKEQUAL(std::string("a=?utf-8?X?b?="), DecodeWords("=?utf-8?Q?a?==?utf-8?X?b?="));
        DISPO_TEST_CHECKEQUAL(std::string("a =?utf-8?Q?b"), DecodeWords("=?utf-8?Q?a?= =?utf-8?Q?b"));

        //A lone '?' inside the text
        DISPO_TEST_CHECKEQUAL(std::string("a?b"), DecodeWords("=?utf-8?Q?a?b?="));

        //Broken base64 keeps the encoded text
        DISPO_TEST_CHECKEQUAL(std::string("S*Y"), DecodeWords("=?utf-8?B?S*Y?="));
        DISPO_TEST_CHECKEQUAL(std::string("Q"), DecodeWords("=?utf-8?B?Q?="));
}

DISPO_TEST_FUNCTION(EncodedWordRejectTest)
{
        //Must start with an encoded word
        DISPO_TEST_CHECKEQUAL(std::string(" =?utf-8?Q?a?="), DecodeWords(" =?utf-8?Q?a?="));
        DISPO_TEST_CHECKEQUAL(std::string("x=?utf-8?Q?a?="), DecodeWords("x=?utf-8?Q?a?="));

        //No control or 8 bit characters anywhere
        DISPO_TEST_CHECKEQUAL(std::string("=?utf-8?Q?a?=\\u0009"), DecodeWords("=?utf-8?Q?a?=\t"));
        DISPO_TEST_CHECKEQUAL(std::string("=?utf-8?Q?a?=\\u00E9"), DecodeWords("=?utf-8?Q?a?=\xE9"));

        //Already decoded text (units above 0xFF) doesn't prevent decoding
        Dispo::UnicodeString value = Dispo::Mime::WidenLatin1("=?utf-8?Q?a?=");
        value.push_back(0x20AC);
        Dispo::UnicodeString output;
        RecordingDecoder decoder;
        Dispo::Mime::DecodeEncodedWords(value,
                                        [&decoder](std::string const &charset, Dispo::UnicodeString *text) { return decoder(charset, text); },
                                        &output);
        DISPO_TEST_CHECKEQUAL(std::string("a\\u20AC"), Dump(output));

        //Unknown encodings and unterminated words
        DISPO_TEST_CHECKEQUAL(std::string("=?utf-8?X?a?="), DecodeWords("=?utf-8?X?a?="));
        DISPO_TEST_CHECKEQUAL(std::string("=?utf-8?Q?a"), DecodeWords("=?utf-8?Q?a"));
        DISPO_TEST_CHECKEQUAL(std::string("=?utf 8?Q?a?="), DecodeWords("=?utf 8?Q?a?="));
}

DISPO_TEST_FUNCTION(EncodedWordCharsetTest)
{
        RecordingDecoder decoder;

        //The charset is passed on as it is written
        DISPO_TEST_CHECKEQUAL(std::string("a b"), DecodeWords("=?ISO-8859-1?Q?a?= =?Utf-8?Q?b?=", &decoder));
        DISPO_TEST_CHECKEQUAL(2u, decoder.charsets.size());
        DISPO_TEST_CHECKEQUAL(std::string("ISO-8859-1"), decoder.charsets[0]);
        DISPO_TEST_CHECKEQUAL(std::string("Utf-8"), decoder.charsets[1]);

        //Words the callback can't decode are kept as the decoded bytes
        decoder.charsets.clear();
        DISPO_TEST_CHECKEQUAL(std::string("\\u00E9"), DecodeWords("=?x-unknown?Q?=E9?=", &decoder));
        DISPO_TEST_CHECKEQUAL(1u, decoder.charsets.size());
        DISPO_TEST_CHECKEQUAL(std::string("x-unknown"), decoder.charsets[0]);

        //An empty charset is passed as well
        decoder.charsets.clear();
        DISPO_TEST_CHECKEQUAL(std::string("a"), DecodeWords("=??Q?a?=", &decoder));
        DISPO_TEST_CHECKEQUAL(1u, decoder.charsets.size());
        DISPO_TEST_CHECKEQUAL(std::string(""), decoder.charsets[0]);
}
