#ifndef dispo_testing
#define dispo_testing

#ifndef dispo_dispolib
#include "dispolib.h"
#endif

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Dispo
{

/// Self-registering unit tests, run by dispotest
namespace Test
{
///True when every check should be echoed to stderr
DISPOLIB_PUBLIC bool ReportAllTests();

/// Evaluates a check condition outside the macro, so constant conditions don't warn
template <class LhsType> inline bool CompareTrue(LhsType lhs)
{
        return lhs;
}

/// Returns an empty string if both sides are equal, a message showing both otherwise
template <class LhsType, class RhsType> std::string CompareEqual(LhsType lhs, RhsType rhs)
{
        std::ostringstream errormsg;
        if (lhs!=rhs)
        {
                errormsg << "expected " << lhs << ", got " << rhs;
                return errormsg.str();
        }
        return std::string();
}

//Mixed signedness: compare as unsigned long, chars as their byte value
template <> inline std::string CompareEqual<int,unsigned>(int lhs, unsigned rhs)
{ return CompareEqual(static_cast<long unsigned>(lhs),static_cast<long unsigned>(rhs)); }
template <> inline std::string CompareEqual<unsigned,int>(unsigned lhs, int rhs)
{ return CompareEqual(static_cast<long unsigned>(lhs),static_cast<long unsigned>(rhs)); }

template <> inline std::string CompareEqual<long int,long unsigned>(long int lhs, long unsigned rhs)
{ return CompareEqual(static_cast<long unsigned>(lhs),static_cast<long unsigned>(rhs)); }
template <> inline std::string CompareEqual<long unsigned,long int>(long unsigned lhs, long int rhs)
{ return CompareEqual(static_cast<long unsigned>(lhs),static_cast<long unsigned>(rhs)); }

template <> inline std::string CompareEqual<char,char>(char lhs, char rhs)
{ return CompareEqual(static_cast<long unsigned>(static_cast<unsigned char>(lhs)),static_cast<long unsigned>(static_cast<unsigned char>(rhs))); }
template <> inline std::string CompareEqual<int,unsigned long>(int lhs, unsigned long rhs)
{ return CompareEqual(static_cast<long unsigned>(lhs),static_cast<long unsigned>(rhs)); }
template <> inline std::string CompareEqual<unsigned long,int >(unsigned long lhs, int rhs)
{ return CompareEqual(static_cast<long unsigned>(lhs),static_cast<long unsigned>(rhs)); }

/// Registers a test function, used through DISPO_TEST_FUNCTION
class DISPOLIB_PUBLIC AddTest
{
        public:
        AddTest(const char *testname, void (*testfunction)());
};

/// Run flags
enum TestOptions
{
        ///Print each test name and its outcome
        TestNoisy=1,
        ///Echo every check
        ReportEveryTest=2,
        ///Stop at the first failing test
        AbortOnFail=4
};

/// Name shown in the progress line
DISPOLIB_PUBLIC void SetTestName(const char *testername);

/** Run the registered tests whose name matches the glob mask
    @param options Combination of TestOptions
    @return true if all of them passed */
DISPOLIB_PUBLIC bool Run(unsigned options, std::string const &mask);

//The extra macro level expands __LINE__ before pasting, giving each registration object its own name
#define GETLINENUMBER(x) x
#define UNIQUENAME(x,y) x##y
#define DO_DISPO_TEST_REGISTER(name,function,line) namespace { ::Dispo::Test::AddTest UNIQUENAME(addtest_,line) (name,function); }
#define DISPO_TEST_FUNCTION(function) void function(); DO_DISPO_TEST_REGISTER(#function,function,GETLINENUMBER(__LINE__)) void function()

/// Thrown by the check macros
class Failure : public std::logic_error
{
        public:
        Failure(std::string const &failure) : std::logic_error(failure)
        {
        }
};

#define DISPO_TEST_FAIL(message) throw ::Dispo::Test::Failure(message)

#define DISPO_TEST_CHECK(condition) do {                                                                                                        \
try {                                                                                                                                           \
if (::Dispo::Test::ReportAllTests())                                                                                                            \
    std::cerr << "Test " << __FILE__ << ":" << __LINE__ << ":" << #condition << std::endl;                                                      \
if (!::Dispo::Test::CompareTrue(condition))                                                                                                     \
    throw ::Dispo::Test::Failure(__FILE__ ":" +Dispo::AnyToString(__LINE__)+ ":Test assertion failed: " #condition);                            \
} catch (::Dispo::Test::Failure &) { throw;                                                                                                     \
} catch (std::exception &e) {                                                                                                                   \
    throw ::Dispo::Test::Failure(__FILE__ ":" +Dispo::AnyToString(__LINE__)+ ":Test assertion failed: exception " +e.what());                   \
} catch (...) {                                                                                                                                 \
    throw ::Dispo::Test::Failure(__FILE__ ":" +Dispo::AnyToString(__LINE__)+ ":Test assertion failed: unexpected exception");                   \
} } while (0)

#define DISPO_TEST_CHECKEQUAL(expected,actual) do {                                                                                             \
try {                                                                                                                                           \
if (::Dispo::Test::ReportAllTests())                                                                                                            \
    std::cerr << "Test " << __FILE__ << ":" << __LINE__ << ":" << #expected << "=" << #actual << std::endl;                                     \
std::string dispo_test_error = ::Dispo::Test::CompareEqual(expected,actual);                                                                    \
if (!dispo_test_error.empty()) {                                                                                                                \
        std::ostringstream errormsg;                                                                                                            \
        errormsg << __FILE__ << ":" << __LINE__ << ":Test assertion failed: " << dispo_test_error;                                              \
        throw ::Dispo::Test::Failure(errormsg.str());                                                                                           \
} } catch (::Dispo::Test::Failure &) {                                                                                                          \
        throw;                                                                                                                                  \
} catch (std::exception &e) {                                                                                                                   \
        std::ostringstream errormsg;                                                                                                            \
        errormsg << __FILE__ << ":" << __LINE__ << ":Test assertion failed: expected " << (expected) << ", got exception: " << e.what();        \
        throw ::Dispo::Test::Failure(errormsg.str());                                                                                           \
} catch (...) {                                                                                                                                 \
        std::ostringstream errormsg;                                                                                                            \
        errormsg << __FILE__ << ":" << __LINE__ << ":Test assertion failed: expected " << (expected) << ", got unexpected exception";           \
        throw ::Dispo::Test::Failure(errormsg.str());                                                                                           \
} } while (0)

#define DISPO_TEST_CHECKTHROW(code,except)  do { bool did_throw=false;                                                                          \
if (::Dispo::Test::ReportAllTests())                                                                                                            \
    std::cerr << "Test " << __FILE__ << ":" << __LINE__ << ":" << #code << " throw " << #except << std::endl;                                   \
try { code ;                                                                                                                                    \
} catch (::Dispo::Test::Failure &) { throw;                                                                                                     \
} catch (except &) { did_throw=true;                                                                                                            \
} catch(std::exception &e) { throw ::Dispo::Test::Failure(__FILE__ ":" +Dispo::AnyToString(__LINE__)+ ":Test assertion failed: expected exception " #except ", got exception: " + e.what());  \
} catch(...) { throw ::Dispo::Test::Failure(__FILE__ ":" +Dispo::AnyToString(__LINE__)+ ":Test assertion failed: expected exception " #except ", got different exception");  \
}                                                                                                                                               \
if (!did_throw) throw ::Dispo::Test::Failure(__FILE__ ":" +Dispo::AnyToString(__LINE__)+ ":Test assertion failed: expected exception " #except ", got NO exception");  \
} while (0)

} //end namespace Test

} //end namespace Dispo

#endif //Sentry
