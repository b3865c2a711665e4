#ifndef dispo_disposition
#define dispo_disposition

#ifndef dispo_dispolib
#include "dispolib.h"
#endif

#include "unicode.h"

#include <optional>

namespace Dispo
{

/** The form of the filename parameter a filename was taken from */
enum FilenameSource
{
        ///No usable filename parameter
        NoFilename,
        ///filename*=charset'language'value
        ExtendedValue,
        ///filename*0=..., filename*1=...
        Continuation,
        ///filename=value
        PlainValue
};

/** Get a readable name for a filename source */
DISPOLIB_PUBLIC const char* GetFilenameSourceName(FilenameSource source);

struct DecodedFilename
{
        DecodedFilename() : source(NoFilename) {}

        FilenameSource source;
        ///The filename, UTF-8 encoded
        std::string filename;
};

/** Decoder state for a single Content-Disposition header */
class DISPOLIB_PUBLIC FilenameDecoder
{
        public:
        FilenameDecoder();

        /** Decode the filename from the header
            @param contentdisposition Header value
            @return The filename and the form it was found in. source is NoFilename if no filename was found */
        DecodedFilename Decode(std::string const &contentdisposition);

        /** Decode text in the specified charset. Only text consisting of bytes (code units 0-255) is decoded
            @param charset Character set label
            @param value Text to convert, replaced by the decoded text if decoding succeeded
            @return true if the text was decoded */
        bool TextDecode(std::string const &charset, UnicodeString *value);

        /** Has no charset decode succeeded yet? */
        bool NeedsEncodingFixup() const { return needs_encoding_fixup; }

        private:
        bool DecodeExtendedValue(std::string const &header, DecodedFilename *result);
        bool DecodeContinuation(std::string const &header, DecodedFilename *result);
        bool DecodePlainValue(std::string const &header, DecodedFilename *result);

        /** Decode a RFC 5987 ext-value (charset'language'text) */
        void Rfc5987Decode(UnicodeString *value);
        /** Decode RFC 2047 encoded words, if the value starts with one */
        void Rfc2047Decode(UnicodeString *value);
        /** Guess the encoding of 8 bit text that wasn't decoded explicitly (UTF-8, then ISO-8859-1) */
        void FixupEncoding(UnicodeString *value);

        ///Set until a charset decode succeeds
        bool needs_encoding_fixup;
};

/** Extract the filename from a Content-Disposition header (RFC 6266), supporting
    RFC 5987 ext-values, RFC 2231 continuations, RFC 2047 encoded words and
    unlabeled UTF-8 or ISO-8859-1 text
    @param contentdisposition Header value (empty if the header is absent)
    @return The decoded filename and its source */
DISPOLIB_PUBLIC DecodedFilename GetFilenameFromContentDisposition(std::string const &contentdisposition);

/** Does a decoded filename pass the extension filter?
    @param filename UTF-8 filename
    @param extension Required extension, compared case-insensitively. Empty to accept any filename
    @return true if the filename is not empty and ends in the extension */
DISPOLIB_PUBLIC bool IsAcceptedFilename(std::string const &filename, std::string const &extension);

/** Extract the filename from a Content-Disposition header, if it names a PDF file
    @return The UTF-8 filename, if the header has one ending in .pdf */
DISPOLIB_PUBLIC std::optional<std::string> ExtractFilenameFromHeader(std::string const &contentdisposition);

/** Extract the filename from a Content-Disposition header, if it has the specified extension
    @param contentdisposition Header value
    @param extension Required extension, compared case-insensitively. Empty to accept any filename
    @return The UTF-8 filename, if the header has an acceptable one */
DISPOLIB_PUBLIC std::optional<std::string> ExtractFilenameFromHeader(std::string const &contentdisposition, std::string const &extension);

} //end namespace Dispo

#endif
