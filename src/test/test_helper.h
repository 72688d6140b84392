/* minimal checks for the standalone test programs.
 * each program counts failed checks and returns nonzero from main if any failed.*/
#ifndef TEST_HELPER_H_INCLUDED
#define TEST_HELPER_H_INCLUDED

#include <iostream>
#include <cmath>
#include <algorithm>
#include <string>

#include "../datatypes.h"

namespace TestStatus
{
  inline int & Checks()
  {
	static int n=0;
	return n;
  }
  inline int & Failures()
  {
	static int n=0;
	return n;
  }
}

#define CHECK(cond) do{ TestStatus::Checks()++; if(!(cond)){ TestStatus::Failures()++; \
  cerr<<__FILE__<<":"<<__LINE__<<": check failed: "<<#cond<<endl;} }while(0)

#define CHECK_EQUAL(a, b) do{ TestStatus::Checks()++; if(!((a)==(b))){ TestStatus::Failures()++; \
  cerr<<__FILE__<<":"<<__LINE__<<": check failed: "<<#a<<" == "<<#b<<" ("<<(a)<<" vs "<<(b)<<")"<<endl;} }while(0)

#define CHECK_CLOSE(a, b, tol) do{ TestStatus::Checks()++; double _a=(a), _b=(b); \
  if(!(fabs(_a-_b)<=(tol)*max(1., max(fabs(_a), fabs(_b))))){ TestStatus::Failures()++; \
  cerr<<__FILE__<<":"<<__LINE__<<": check failed: "<<#a<<" ~= "<<#b<<" ("<<_a<<" vs "<<_b<<")"<<endl;} }while(0)

/*check that statement throws exception type E*/
#define CHECK_THROW(statement, E) do{ TestStatus::Checks()++; bool _thrown=false; \
  try{ statement; } catch(const E &){ _thrown=true; } \
  if(!_thrown){ TestStatus::Failures()++; cerr<<__FILE__<<":"<<__LINE__<<": "<<#statement<<" did not throw "<<#E<<endl;} }while(0)

inline int TestReport(const string &name, int rank=0)
{
  if(TestStatus::Failures())
	cerr<<"[rank "<<rank<<"] "<<name<<": "<<TestStatus::Failures()<<" of "<<TestStatus::Checks()<<" checks failed"<<endl;
  else if(rank==0)
	cout<<name<<": "<<TestStatus::Checks()<<" checks passed"<<endl;
  return TestStatus::Failures()?1:0;
}

#endif
