#include <dispo/dispolib.h>

#include <stdexcept>
#include <algorithm>
#include "getopt.h"

namespace Dispo
{

OptionParser::Option::Option(std::string const &_name, char _shortname, ParamType _type, unsigned _value)
: optionname(_name)
, shortname(_shortname)
, type(_type)
, value(_value)
{}

OptionParser::Option::~Option()
{
}

OptionParser::Option OptionParser::Option::Switch(std::string const &name, char shortname, bool initial_value)
{
        return Option(name, shortname, PSwitch, initial_value ? 1 : 0);
}

OptionParser::Option OptionParser::Option::StringOpt(std::string const &name, char shortname)
{
        return Option(name, shortname, PStringOpt, 0);
}

OptionParser::Option OptionParser::Option::Param(std::string const &name, bool mandatory)
{
        return Option(name, 0, PParam, mandatory);
}

OptionParser::Option OptionParser::Option::ParamList(std::string const &name)
{
        return Option(name, 0, PParamList, 0);
}

OptionParser::Option OptionParser::Option::ListEnd()
{
        return Option("", 0, PListEnd, 0);
}

OptionParser::OptionParser(Option const options[])
{
        Option const *curopt=options;
        while (curopt->type != Option::PListEnd)
            opts.push_back(*curopt++);
}

OptionParser::~OptionParser()
{
}

void OptionParser::ValidateOptions()
{
        std::set<std::string> names;
        std::set<char> shortnames;
        bool paramsgoneoptional = false;
        bool hadlist = false;

        for (unsigned counter=0;counter<opts.size();++counter)
        {
                Option const &opt = opts[counter];
                if (names.count(opt.optionname))
                    throw std::logic_error("All options must have unique names");
                if (opt.optionname.empty() || opt.optionname.find_first_of("-+=") != std::string::npos)
                    throw std::logic_error("Illegal option name");
                names.insert(opt.optionname);

                if (opt.shortname)
                {
                        if (!opt.OptionIsReferencable())
                            throw std::logic_error("Parameters cannot have a short name");
                        if (opt.shortname=='-' || opt.shortname=='+' || opt.shortname=='=' || shortnames.count(opt.shortname))
                            throw std::logic_error("Illegal or duplicate short option name");
                        shortnames.insert(opt.shortname);
                }

                if (opt.type == Option::PParam)
                {
                        if (hadlist)
                            throw std::logic_error("Parameter may not be put after a parameter list");
                        if (!opt.value)
                            paramsgoneoptional = true;
                        else if (paramsgoneoptional)
                            throw std::logic_error("Optional parameters must be put after mandatory parameters");
                }
                if (opt.type == Option::PParamList)
                {
                        if (hadlist)
                            throw std::logic_error("Only one parameter list is allowed");
                        hadlist = true;
                }
        }
}

bool OptionParser::ParseParameter(Option const *opt, std::string const &parameter)
{
        if (opt->type != Option::PStringOpt)
            throw std::logic_error("Don't know how to parse this unconcatenable option type");

        if (stringvalues.count(opt->optionname))
        {
                currenterror = "String option '" + opt->optionname + "' used twice";
                return false;
        }
        stringvalues[opt->optionname] = parameter;
        return true;
}

unsigned OptionParser::ParseConcatenableOption(Option const *option, std::string const &data)
{
        //Concatenable option (eg, -ab may set both -a and -b)
        if (option->type != Option::PSwitch)
            throw std::logic_error("Don't know how to parse this concatenable option type");

        bool has_enable_flag = !data.empty() && data[0]=='+';
        bool has_disable_flag = !data.empty() && data[0]=='-';

        switchvalues[option->optionname] = !has_disable_flag;

        return has_enable_flag || has_disable_flag ? 1 : 0;
}

unsigned OptionParser::ParseLongOption(std::string const &current, std::string const *next)
{
        std::string::size_type equals = current.find('=', 2);
        std::string optname(current, 2, equals == std::string::npos ? std::string::npos : equals - 2);

        Option const *opt = FindOption(optname, Option::PAny);
        if (!opt || !opt->OptionIsReferencable())
        {
                currenterror="Unknown option '" + optname + "'";
                return 0;
        }

        if (opt->OptionHasParameter())
        {
                if (equals != std::string::npos) //parameter is 'embedded' into long option
                {
                        return ParseParameter(opt, current.substr(equals+1)) ? 1 : 0;
                }
                else if (next)
                {
                        return ParseParameter(opt, *next) ? 2: 0;
                }
                else
                {
                        currenterror = "Missing parameter for string option '" + optname + "'";
                        return 0;
                }
        }

        if (equals != std::string::npos)
        {
                currenterror = "Switch '" + optname + "' does not take a parameter";
                return 0;
        }
        ParseConcatenableOption(opt, std::string());
        return 1;
}

unsigned OptionParser::ParseShortOptions(std::string const &current, std::string const *next)
{
        std::string arg(current, 1);

        while (!arg.empty()) //parse one or more short options
        {
                Option const *opt = FindShortOption(arg[0]);
                if (!opt)
                {
                        currenterror="Unknown option '" + arg.substr(0,1) + "'";
                        return 0;
                }

                if (opt->OptionHasParameter())
                {
                        //This option supports parameters, and is not concatenable
                        //If option isn't followed by anything, parameter is in next argument
                        //Optionally eat one '=' to parse the option
                        if (arg.size() == 1)
                        {
                                if (!next)
                                {
                                        currenterror = "Missing parameter for string option '" + opt->optionname + "'";
                                        return 0;
                                }
                                if (!ParseParameter(opt, *next))
                                    return 0;
                                return 2; //parsed 2 parameters
                        }
                        else
                        {
                                //option shuld follow this parameter
                                std::string parameter(arg[1]=='=' ? arg.begin()+2 : arg.begin()+1,arg.end());
                                if (!ParseParameter(opt, parameter))
                                    return 0;
                                return 1; //parsed 1 parameter
                        }
                }
                else
                {
                        std::string optiondata(arg.begin()+1,arg.end());
                        unsigned bytes_parsed = ParseConcatenableOption(opt, optiondata);
                        arg.erase(arg.begin(),arg.begin()+1+bytes_parsed);
                }
        }
        return 1; //parsed 1 parameter
}

bool OptionParser::Parse(std::vector<std::string> const &args)
{
        ValidateOptions();

        currenterror = "Unknown internal error in option parser";
        switchvalues.clear();
        stringvalues.clear();
        stringlistvalues.clear();

        unsigned counter = 1; // Skip name of executable
        unsigned optioncounter = 0;

        //Parse options
        for (; counter < args.size(); ++ counter)
        {
                std::string const &arg = args[counter];
                if (arg.size() == 1 || arg[0]!='-') //end of options, start of parameters
                    break;
                if (arg == "--") //forced end of options
                {
                         ++counter;
                         break;
                }

                std::string const *next = counter+1 < args.size() ? &args[counter+1] : NULL;
                unsigned num_parsed;
                if (arg[1]=='-')
                    num_parsed=ParseLongOption(arg, next);
                else
                    num_parsed=ParseShortOptions(arg, next);

                if (num_parsed == 2)
                    ++counter;
                else if (num_parsed != 1)
                    return false;
        }

        //Parse other parameters
        for (;counter < args.size();++counter)
        {
                std::string const &parameter = args[counter];
                while (optioncounter<opts.size() && opts[optioncounter].type != Option::PParam && opts[optioncounter].type != Option::PParamList)
                    ++optioncounter;

                if (optioncounter == opts.size())
                {
                        currenterror = "Encountered unexpected parameter '" + parameter + "'";
                        return false;
                }

                if (opts[optioncounter].type == Option::PParam)
                {
                        stringvalues[opts[optioncounter].optionname] = parameter;
                        ++optioncounter;
                }
                else
                {
                        stringlistvalues[opts[optioncounter].optionname].push_back(parameter);
                }
        }
        while (optioncounter<opts.size() && opts[optioncounter].type != Option::PParam && opts[optioncounter].type != Option::PParamList)
            ++optioncounter;

        if (optioncounter < opts.size() && opts[optioncounter].type == Option::PParam && opts[optioncounter].value)
        {
                currenterror = "Missing parameter " + opts[optioncounter].optionname;
                return false;
        }

        currenterror.clear();
        return true;
}

std::string OptionParser::GetErrorDescription() const
{
        return currenterror;
}

OptionParser::Option const * OptionParser::FindOption(std::string const &optionname, Option::ParamType type) const
{
        for (unsigned i=0;i<opts.size();++i)
          if (opts[i].optionname == optionname)
        {
                if (type != Option::PAny && opts[i].type != type)
                    throw std::logic_error("Option " + optionname + " has wrong type");

                return &opts[i];
        }
        return NULL;
}

OptionParser::Option const * OptionParser::FindShortOption(char shortname) const
{
        for (unsigned i=0;i<opts.size();++i)
          if (opts[i].shortname && opts[i].shortname == shortname)
            return &opts[i];
        return NULL;
}

bool OptionParser::Exists(std::string const &optionname) const
{
        if (!FindOption(optionname, Option::PAny))
            throw std::logic_error("No such option " + optionname);

        return switchvalues.count(optionname) || stringvalues.count(optionname) || stringlistvalues.count(optionname);
}

bool OptionParser::Switch(std::string const &optionname) const
{
        Option const *opt = FindOption(optionname, Option::PSwitch);
        if (!opt)
            throw std::logic_error("No such option " + optionname);

        std::map<std::string, bool>::const_iterator it = switchvalues.find(optionname);
        if (it==switchvalues.end())
            return opt->value;
        else
            return it->second;
}

std::string const & OptionParser::StringOpt(std::string const &optionname) const
{
        if (!FindOption(optionname, Option::PStringOpt))
            throw std::logic_error("No such option " + optionname);

        std::map<std::string, std::string>::const_iterator it = stringvalues.find(optionname);
        if (it == stringvalues.end())
           return emptystring;
        else
           return it->second;
}

std::string const &  OptionParser::Param(std::string const &optionname) const
{
        if (!FindOption(optionname, Option::PParam))
            throw std::logic_error("No such option " + optionname);

        std::map<std::string, std::string>::const_iterator it = stringvalues.find(optionname);
        if (it == stringvalues.end())
           return emptystring;
        else
           return it->second;
}

std::vector<std::string> const & OptionParser::ParamList(std::string const &optionname) const
{
        if (!FindOption(optionname, Option::PParamList))
            throw std::logic_error("No such option " + optionname);

        std::map<std::string, std::vector<std::string> >::const_iterator it = stringlistvalues.find(optionname);
        if (it == stringlistvalues.end())
           return emptystringlist;
        else
           return it->second;
}

}
