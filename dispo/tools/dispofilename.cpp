//---------------------------------------------------------------------------
#include "../dispolib.h"
#include <iostream>
#include <string>
#include <vector>

//---------------------------------------------------------------------------

#include "../disposition.h"
#include "../getopt.h"
#include "../utils.h"

namespace
{

Dispo::OptionParser::Option optionlist[] =
{
        Dispo::OptionParser::Option::Switch("all", 'a', false),
        Dispo::OptionParser::Option::StringOpt("extension", 'e'),
        Dispo::OptionParser::Option::Switch("source", 's', false),
        Dispo::OptionParser::Option::Switch("timestamps", 't', false),
        Dispo::OptionParser::Option::Switch("verbose", 'v', false),
        Dispo::OptionParser::Option::ParamList("headers"),
        Dispo::OptionParser::Option::ListEnd()
};

struct ToolOptions
{
        std::string extension;
        bool show_source;
        bool verbose;
};

void ShowSyntax()
{
        std::cout << "Syntax: dispofilename [options] [header...]\n";
        std::cout << "Prints the filename from every Content-Disposition header value, one per line.\n";
        std::cout << "Without header arguments, header values are read from stdin, one per line.\n";
        std::cout << " -a, --all: Accept any filename, not just those with the required extension\n";
        std::cout << " -e, --extension <ext>: Required filename extension (default: .pdf)\n";
        std::cout << " -s, --source: Prefix every filename with the parameter form it was found in\n";
        std::cout << " -t, --timestamps: Add timestamps to diagnostics\n";
        std::cout << " -v, --verbose: Print diagnostics for every header to stderr" << std::endl;
}

void ProcessHeader(ToolOptions const &opts, std::string const &header)
{
        Dispo::DecodedFilename decoded = Dispo::GetFilenameFromContentDisposition(header);
        bool accepted = Dispo::IsAcceptedFilename(decoded.filename, opts.extension);

        if (opts.verbose)
        {
                if (decoded.source == Dispo::NoFilename)
                    LOGPRINT("'" << header << "': no filename parameter");
                else
                    LOGPRINT("'" << header << "': " << Dispo::GetFilenameSourceName(decoded.source) << " filename '" << decoded.filename << "'" << (accepted ? "" : " rejected"));
        }

        if (opts.show_source)
            std::cout << Dispo::GetFilenameSourceName(accepted ? decoded.source : Dispo::NoFilename) << '\t';
        std::cout << (accepted ? decoded.filename : std::string()) << '\n';
}

} //end anonymous namespace

int UTF8Main(std::vector<std::string> const &args)
{
        Dispo::OptionParser parser(optionlist);
        if (!parser.Parse(args))
        {
                LOGPRINT(parser.GetErrorDescription());
                return ShowSyntax(),EXIT_FAILURE;
        }
        if (parser.Switch("all") && parser.Exists("extension"))
        {
                LOGPRINT("Options --all and --extension cannot be combined");
                return ShowSyntax(),EXIT_FAILURE;
        }

        Dispo::ErrStream::SetTimestamping(parser.Switch("timestamps"));

        ToolOptions opts;
        opts.extension = parser.Switch("all") ? std::string() : parser.Exists("extension") ? parser.StringOpt("extension") : std::string(".pdf");
        opts.show_source = parser.Switch("source");
        opts.verbose = parser.Switch("verbose");

        std::vector<std::string> const &headers = parser.ParamList("headers");
        if (!headers.empty())
        {
                for (std::vector<std::string>::const_iterator itr = headers.begin(); itr != headers.end(); ++itr)
                    ProcessHeader(opts, *itr);
                return EXIT_SUCCESS;
        }

        std::string line;
        while (Dispo::ReadConsoleLine(&line))
        {
                ProcessHeader(opts, line);
                std::cout.flush();
        }
        return EXIT_SUCCESS;
}

//---------------------------------------------------------------------------
int main(int argc, char *argv[])
{
        return Dispo::InvokeMyMain(argc,argv,&UTF8Main);
}
