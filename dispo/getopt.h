#ifndef dispo_getopt
#define dispo_getopt

#ifndef dispo_dispolib
#include "dispolib.h"
#endif

#include <vector>
#include <map>
#include <set>

namespace Dispo
{

/** Command-line option parser.

    Options are referred to by their name, as --name. Options with a short
    name can also be given as -x, and short switches can be combined (-vs).
    A switch can be followed by '+' or '-' to set it explicitly (-v-).
    String options take their value from the same argument (--name=value,
    -xvalue, -x=value) or from the next one (--name value, -x value).

    The option table is checked on every Parse call: at most one
    ParamList, placed after every Param, and no mandatory Param after an
    optional one.

    Example code:
    Dispo::OptionParser::Option optionlist[] =
    {
        Dispo::OptionParser::Option::Switch("verbose", 'v', false),
        Dispo::OptionParser::Option::StringOpt("extension", 'e'),
        Dispo::OptionParser::Option::Param("command", true),
        Dispo::OptionParser::Option::ParamList("headers"),
        Dispo::OptionParser::Option::ListEnd()
    };

        Dispo::OptionParser parser(optionlist);
        if (!parser.Parse(args))
            return ShowSyntax(), 1;

        //then query parser.Switch("verbose"), parser.ParamList("headers")
*/
class DISPOLIB_PUBLIC OptionParser
{
    public:
        class Option
        {
            private:
                ///Kind of table entry
                enum ParamType
                {
                        PAny=-1,
                        PListEnd=0,
                        PSwitch,
                        PStringOpt,
                        PParam,
                        PParamList
                };

                std::string optionname;
                char shortname;
                ParamType type;
                unsigned value;
                Option(std::string const &name, char shortname, ParamType type, unsigned value);
            public:
                ~Option();

                ///True for switches and string options, which are given as --name
                bool OptionIsReferencable() const
                {
                        return type != PParam && type != PParamList;
                }

                ///True if the option consumes a value
                bool OptionHasParameter() const
                {
                        return type == PStringOpt;
                }

                ///On/off option. A shortname of 0 means long name only
                static Option Switch(std::string const &name, char shortname, bool initial_value);

                ///Option with a string value
                static Option StringOpt(std::string const &name, char shortname);

                ///Positional argument
                static Option Param(std::string const &name, bool mandatory);

                ///Collects the positional arguments left over after the Params
                static Option ParamList(std::string const &name);

                ///Terminates an option table
                static Option ListEnd();

                friend class OptionParser;
        };

        /** @param options Option table, terminated by ListEnd */
        OptionParser(Option const options[]);

        ~OptionParser();

        /** Checks the option table, throws std::logic_error on a broken one */
        void ValidateOptions();

        /** Parse a command line
            @param args Arguments, args[0] being the program name
            @return false on a usage error, GetErrorDescription() then says what was wrong */
        bool Parse(std::vector<std::string> const &args);

        ///Description of the first usage error
        std::string GetErrorDescription() const;

        //Accessors throw std::logic_error for a name that is not in the option table

        ///True if the option or parameter was given on the command line
        bool Exists(std::string const &optionname) const;

        ///Switch state, its initial value if not given
        bool Switch(std::string const &optionname) const;

        ///String option value, empty if not given
        std::string const & StringOpt(std::string const &optionname) const;

        ///Positional parameter value, empty if not given
        std::string const & Param(std::string const &optionname) const;

        ///Arguments collected by the ParamList
        std::vector<std::string> const & ParamList(std::string const &optionname) const;

    private:
        std::vector<Option> opts;

        std::string currenterror;

        std::map<std::string, bool> switchvalues;
        std::map<std::string, std::string> stringvalues;
        std::map<std::string, std::vector<std::string> > stringlistvalues;

        std::string const emptystring;
        std::vector<std::string> const emptystringlist;

        /** Look up an option by name. With a type other than PAny, a name of
            another kind throws std::logic_error. Returns NULL if not found */
        Option const * FindOption(std::string const &name, Option::ParamType type) const;

        ///Look up an option by its one letter name, NULL if not found
        Option const * FindShortOption(char shortname) const;

        ///Store the value of a string option, rejecting a second occurrence
        bool ParseParameter(Option const *opt, std::string const &parameter);

        /** Apply a switch, reading an optional trailing '+' or '-' from data
            @return Number of characters of data consumed */
        unsigned ParseConcatenableOption(Option const *opt, std::string const &data);

        /** Handle an argument starting with a single '-'
            @param next Following argument, NULL at the end of the command line
            @return Arguments consumed: 0 on error (see currenterror), 1, or 2 when next held the value */
        unsigned ParseShortOptions(std::string const &current, std::string const *next);

        /** Handle an argument starting with '--', same return values as ParseShortOptions */
        unsigned ParseLongOption(std::string const &current, std::string const *next);
};

}

#endif //sentry
