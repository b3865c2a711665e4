#include <dispo/dispolib.h>

#include <iostream>
#include <string>
#include <vector>
#include "testing.h"

namespace Dispo
{

namespace Test
{

bool report_all_tests = false;
bool ReportAllTests()
{
        return report_all_tests;
}
std::string testsuite_name;

typedef void (*TestFunction)();

struct SingleTest
{
        std::string name;
        TestFunction func;
};

//Allocated on first use, registration happens during static initialization
std::vector<SingleTest> *testlist;

AddTest::AddTest(const char *testname, TestFunction testfunc)
{
        if(!testlist)
            testlist=new std::vector<SingleTest>;

        SingleTest newtest;
        newtest.name=testname;
        newtest.func=testfunc;
        testlist->push_back(newtest);
}

void SetTestName(const char *testername)
{
        testsuite_name=testername;
}

bool Run(unsigned options, std::string const &mask)
{
        if (!testlist)
        {
                std::cerr << "No registered tests\n";
                return false;
        }
        if (testsuite_name.empty())
        {
                std::cerr << "Use SetTestName first\n";
                return false;
        }

        unsigned count_failure=0;

        report_all_tests = options & ReportEveryTest ? true : false;

        unsigned testcount = 0;
        for (unsigned i=0;i<testlist->size();++i)
        {
                if (StrLike((*testlist)[i].name, mask))
                    ++testcount;
        }
        if (testcount == 0)
        {
                std::cerr << "No tests match '" << mask << "'\n";
                return false;
        }

        unsigned testnum = 0;
        for (unsigned i=0;i<testlist->size()&&(count_failure==0 || !(options & AbortOnFail));++i)
        {
                if (!StrLike((*testlist)[i].name, mask))
                    continue;

                SingleTest &test=(*testlist)[i];
                if (options & TestNoisy)
                {
                        std::cout << test.name << ':' << std::flush;
                }
                else
                {
                        std::cout << testsuite_name << ": " << testnum << " / " << testcount << "\r" << std::flush;
                }
                ++testnum;

                try
                {
                        test.func();
                }
                catch (Failure &e)
                {
                        if (options & TestNoisy)
                        {
                                std::cout << "FAILED\n";
                        }
                        else
                        {
                                std::cout << "\nTest " << test.name << " failure\n";
                        }
                        std::cout << e.what() << "\n";
                        ++count_failure;
                        continue;
                }
                catch (std::exception&e)
                {
                        std::cout<<"\nTest '" << test.name << "': Unexpected exception: '" << e.what () << "\n";
                        ++count_failure;
                        break;
                }

                if (options & TestNoisy)
                    std::cout<<"passed\n";
        }
        if (!(options & TestNoisy))
            std::cout << testsuite_name << ": " << testcount << " / " << testcount << "\r" << std::flush;

        std::cout << "\n";

        if (count_failure > 0)
        {
                std::cerr << count_failure << " out of " << testcount << " tests failed\n";
        }
        else
        {
                std::cerr << "All " << testcount << " tests passed\n";
        }

        delete testlist;
        testlist=NULL;
        return count_failure==0;
}

} //end namespace Test

} //end namespace Dispo
