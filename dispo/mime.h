#ifndef dispo_mime
#define dispo_mime

#ifndef dispo_dispolib
#include "dispolib.h"
#endif

#include "unicode.h"

#include <vector>

namespace Dispo {

namespace Mime {

/** Decoder for the Q encoding of RFC 2047 encoded words: '_' is a space and
    '=XX' is the byte XX. An '=' not followed by two hex digits is copied */
template <class OutputIterator> class QuotedPrintableDecoder
{
        int state; //-2 = expecting any character, -1 = just got a '=', 0-15 = got '=' and one hex digit
        uint32_t first_digit;

        public:
        /** Initialize the decoder, waiting for a byte */
        QuotedPrintableDecoder(OutputIterator _output)
        : state(-2)
        , first_digit(0)
        , output(_output)
        { }

        void operator() (uint32_t inputchar)
        {
                if (state==-2)
                {
                        if (inputchar=='_')
                            *output++=uint32_t(' ');
                        else if (inputchar=='=')
                            state=-1;
                        else
                            *output++=inputchar;
                        return;
                }

                int digit = inputchar < 128 ? HexDigitValue(char(inputchar)) : -1;
                if (state==-1)
                {
                        if (digit<0) //not an escape, the '=' is literal
                        {
                                *output++=uint32_t('=');
                                state=-2;
                                operator()(inputchar);
                                return;
                        }
                        state=digit;
                        first_digit=inputchar;
                        return;
                }

                if (digit<0) //broken escape, both characters are literal
                {
                        *output++=uint32_t('=');
                        *output++=first_digit;
                        state=-2;
                        operator()(inputchar);
                        return;
                }
                *output++=uint32_t(state*16+digit);
                state=-2;
        }

        /** Flush any partial escape at the end of the input */
        void Finish()
        {
                if (state!=-2)
                    *output++=uint32_t('=');
                if (state>=0)
                    *output++=first_digit;
                state=-2;
        }

        OutputIterator output;
};

/** The three forms a filename parameter can take in a Content-Disposition header */
enum FilenameParamForm
{
        ///filename=value
        PlainForm,
        ///filename*=charset'language'value (RFC 5987)
        ExtendedForm,
        ///filename*N=value or filename*N*=value (RFC 2231 continuations)
        ContinuationForm
};

/** Description of a filename parameter found inside a header */
struct FilenameParam
{
        ///Continuation index (ContinuationForm only)
        uint32_t index;
        ///True if the continuation was marked as percent-encoded (filename*N*=)
        bool extended;
        ///Start of the parameter's value (a token, or a quoted string including its quotes)
        std::string::size_type start_value;
        ///End of the parameter's value
        std::string::size_type end_value;
};

/** One part of a RFC 2231 continuation */
struct ContinuationPart
{
        uint32_t index;
        bool extended;
        ///The raw value, still quoted and escaped
        std::string fragment;
};

/** Look up a filename parameter in a Content-Disposition header. A parameter
    is recognized at the start of the header or directly after a ';', with
    optional whitespace around its name and the '='. Names are compared
    case-insensitively.
    @param header Header to search
    @param from Offset to start looking from. Offset 0 also accepts a parameter at the very start of the header
    @param form Parameter form to look for
    @param param Receives the parameter if found. For ContinuationForm, parameters with an index that does not fit 32 bits are skipped
    @return true if a parameter was found */
bool DISPOLIB_PUBLIC FindFilenameParameter(std::string const &header, std::string::size_type from, FilenameParamForm form, FilenameParam *param);

/** Collect the RFC 2231 continuation parts (filename*0, filename*1...) in a header
    @param header Header to search
    @param parts Receives the parts with consecutive indices from 0 up, in index
           order. A later duplicate of an index is ignored
    @return false if the header contains filename*0 more than once */
bool DISPOLIB_PUBLIC CollectContinuationParts(std::string const &header, std::vector<ContinuationPart> *parts);

/** Unquote a parameter value the way RFC 2616 quoted strings are written.
    Values that don't start with a quote are returned unchanged. The quoted
    string ends at the first unescaped quote, or at the end of the value */
std::string DISPOLIB_PUBLIC Rfc2616Unquote(std::string const &value);

/** Undo percent escaping: %uXXXX becomes the code unit XXXX, %XX becomes the byte XX, any other '%' is kept */
UnicodeString DISPOLIB_PUBLIC PercentUnescape(std::string const &value);

/** Widen a byte string, every byte becoming a code unit 0-255 */
UnicodeString DISPOLIB_PUBLIC WidenLatin1(std::string const &value);

/** Split a RFC 5987 ext-value (charset'language'value)
    @param extvalue Value to split
    @param charset Receives the charset (UTF-8 encoded)
    @param value Receives the value, with the language part removed
    @return false if the value has no charset (contains no ') */
bool DISPOLIB_PUBLIC SplitExtValue(UnicodeString const &extvalue, std::string *charset, UnicodeString *value);

/** Callback to decode text in a specified charset. Should replace the value and return true if it could decode the text */
typedef std::function< bool(std::string const &charset, UnicodeString *value) > TextDecodeCallback;

/** Decode 'encoded words' (RFC 2047 text). Only values that start with an
    encoded word and don't contain control or 8-bit characters are decoded,
    anything else is copied unchanged. Text between encoded words, including
    whitespace, is kept.
    @param value Text to decode
    @param textdecode Callback that converts the bytes of every encoded word from its charset
    @param decoded_output String to append the decoded text to */
void DISPOLIB_PUBLIC DecodeEncodedWords(UnicodeString const &value, TextDecodeCallback const &textdecode, UnicodeString *decoded_output);

} //end namespace Mime
} //end namespace Dispo

#endif
