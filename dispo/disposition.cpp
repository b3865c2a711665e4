#include <dispo/dispolib.h>

#include "disposition.h"
#include "mime.h"

namespace Dispo
{

const char* GetFilenameSourceName(FilenameSource source)
{
        switch (source)
        {
        case ExtendedValue: return "ext-value";
        case Continuation:  return "continuation";
        case PlainValue:    return "plain";
        default:            return "none";
        }
}

FilenameDecoder::FilenameDecoder()
: needs_encoding_fixup(true)
{
}

bool FilenameDecoder::TextDecode(std::string const &charset, UnicodeString *value)
{
        if (charset.empty() || value->empty())
            return false;

        //Anything outside the byte range means the value was already decoded
        std::string bytes;
        bytes.reserve(value->size());
        for (UnicodeString::const_iterator itr = value->begin(); itr != value->end(); ++itr)
        {
                if (*itr > 0xFF)
                    return false;
                bytes.push_back(char(*itr));
        }

        Charsets::Charset page = FindCharacterset(charset);
        UnicodeString decoded;
        if (page != Charsets::Unknown
            && ConvertCharsetToUnicode(reinterpret_cast<const uint8_t*>(bytes.data()), reinterpret_cast<const uint8_t*>(bytes.data() + bytes.size()), page, &decoded))
        {
                value->swap(decoded);
                needs_encoding_fixup = false;
                return true;
        }

        DEBUGPRINT("Charset '" << charset << "' " << (page == Charsets::Unknown ? "is not supported" : "does not match the data") << ", keeping the raw bytes");
        return false;
}

void FilenameDecoder::Rfc5987Decode(UnicodeString *value)
{
        std::string charset;
        UnicodeString text;
        if (!Mime::SplitExtValue(*value, &charset, &text))
            return; //no charset'language' prefix, accept the value as it is

        //An undecodable value is used as is, minus the charset and language
        TextDecode(charset, &text);
        value->swap(text);
}

void FilenameDecoder::Rfc2047Decode(UnicodeString *value)
{
        UnicodeString decoded;
        Mime::DecodeEncodedWords(*value,
                                 [this](std::string const &charset, UnicodeString *text) { return TextDecode(charset, text); },
                                 &decoded);
        value->swap(decoded);
}

void FilenameDecoder::FixupEncoding(UnicodeString *value)
{
        if (!needs_encoding_fixup)
            return;

        bool have_8bit = false;
        for (UnicodeString::const_iterator itr = value->begin(); itr != value->end() && !have_8bit; ++itr)
            have_8bit = *itr >= 0x80 && *itr <= 0xFF;
        if (!have_8bit)
            return;

        //Maybe multi-byte UTF-8, otherwise treat it as ISO-8859-1
        if (!TextDecode("utf-8", value))
            TextDecode("iso-8859-1", value);
}

bool FilenameDecoder::DecodeExtendedValue(std::string const &header, DecodedFilename *result)
{
        Mime::FilenameParam param;
        if (!Mime::FindFilenameParameter(header, 0, Mime::ExtendedForm, &param))
            return false;

        UnicodeString value = Mime::PercentUnescape(header.substr(param.start_value, param.end_value - param.start_value));
        Rfc5987Decode(&value);
        Rfc2047Decode(&value);
        FixupEncoding(&value);

        result->source = ExtendedValue;
        result->filename = EncodeUTF8(value);
        return true;
}

bool FilenameDecoder::DecodeContinuation(std::string const &header, DecodedFilename *result)
{
        std::vector<Mime::ContinuationPart> parts;
        if (!Mime::CollectContinuationParts(header, &parts))
        {
                DEBUGPRINT("Header has more than one filename*0, ignoring its continuations");
                return false;
        }

        UnicodeString value;
        for (std::vector<Mime::ContinuationPart>::const_iterator itr = parts.begin(); itr != parts.end(); ++itr)
        {
                std::string part = Mime::Rfc2616Unquote(itr->fragment);
                if (itr->extended)
                {
                        UnicodeString decoded = Mime::PercentUnescape(part);
                        if (itr->index == 0) //only the first part carries the charset
                            Rfc5987Decode(&decoded);
                        value.insert(value.end(), decoded.begin(), decoded.end());
                }
                else
                {
                        UnicodeString widened = Mime::WidenLatin1(part);
                        value.insert(value.end(), widened.begin(), widened.end());
                }
        }
        if (value.empty())
            return false;

        Rfc2047Decode(&value);
        FixupEncoding(&value);

        result->source = Continuation;
        result->filename = EncodeUTF8(value);
        return true;
}

bool FilenameDecoder::DecodePlainValue(std::string const &header, DecodedFilename *result)
{
        Mime::FilenameParam param;
        if (!Mime::FindFilenameParameter(header, 0, Mime::PlainForm, &param))
            return false;

        UnicodeString value = Mime::WidenLatin1(Mime::Rfc2616Unquote(header.substr(param.start_value, param.end_value - param.start_value)));
        Rfc2047Decode(&value);
        FixupEncoding(&value);

        result->source = PlainValue;
        result->filename = EncodeUTF8(value);
        return true;
}

DecodedFilename FilenameDecoder::Decode(std::string const &contentdisposition)
{
        DecodedFilename result;
        needs_encoding_fixup = true;
        if (contentdisposition.empty())
            return result;

        if (!DecodeExtendedValue(contentdisposition, &result)
            && !DecodeContinuation(contentdisposition, &result)
            && !DecodePlainValue(contentdisposition, &result))
            DEBUGPRINT("No filename parameter in '" << contentdisposition << "'");
        return result;
}

DecodedFilename GetFilenameFromContentDisposition(std::string const &contentdisposition)
{
        FilenameDecoder decoder;
        return decoder.Decode(contentdisposition);
}

bool IsAcceptedFilename(std::string const &filename, std::string const &extension)
{
        return !filename.empty() && StrCaseEndsWith(filename, extension);
}

std::optional<std::string> ExtractFilenameFromHeader(std::string const &contentdisposition)
{
        return ExtractFilenameFromHeader(contentdisposition, ".pdf");
}

std::optional<std::string> ExtractFilenameFromHeader(std::string const &contentdisposition, std::string const &extension)
{
        if (contentdisposition.empty())
            return std::nullopt;

        DecodedFilename decoded = GetFilenameFromContentDisposition(contentdisposition);
        if (!IsAcceptedFilename(decoded.filename, extension))
            return std::nullopt;
        return decoded.filename;
}

} //end namespace Dispo
