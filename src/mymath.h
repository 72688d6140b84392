#ifndef MYMATH_HEADER_INCLUDED
#define MYMATH_HEADER_INCLUDED

#include <iostream>
#include <cstdlib>
#include <cstdio>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>
#include <chrono>
#include <string>
#include <vector>
#include <algorithm>
#include <mpi.h>

#include "datatypes.h"

template <class T>
void VectorFree(vector <T> &x)
{
  vector <T>().swap(x);
}

template <class T, class T2>
size_t CompileOffsets(const vector <T> &Counts, vector <T2> &Offsets)
/*exclusive prefix sum of Counts; returns the total*/
{
  size_t offset=0;
  Offsets.resize(Counts.size());
  for(size_t i=0;i<Counts.size();i++)
  {
	Offsets[i]=offset;
	offset+=Counts[i];
  }
  return offset;
}

class Timer_t
/*wall clock ticks of the run phases*/
{
  vector <chrono::steady_clock::time_point> tickers;
public:
  Timer_t()
  {
	tickers.reserve(20);
  }
  void Tick()
  {
	tickers.push_back(chrono::steady_clock::now());
  }
  void Tick(MPI_Comm comm)
  //synchronized tick. wait for all processes to tick together.
  {
	MPI_Barrier(comm);
	Tick();
  }
  void Reset()
  {
	tickers.clear();
  }
  int Size() const
  {
	return tickers.size();
  }
  double GetSeconds(int itick) const
  /*time from the previous tick to tick itick. itick<0 counts from the end.*/
  {
	if(itick<0) itick+=Size();
	if(itick<1||itick>=Size())
	  throw out_of_range("no timing interval ends at tick "+to_string(itick));
	return chrono::duration_cast<chrono::duration<double> >(tickers[itick]-tickers[itick-1]).count();
  }
};

inline bool file_exist(const string &filename)
{ struct stat buffer;
  return (stat(filename.c_str(), &buffer) == 0);
}
inline HPReal position_modulus(HPReal x, HPReal boxsize)
{//shift the positions to within [0,boxsize)
	HPReal y;
	if(x>=0&&x<boxsize) return x;
	y=x/boxsize;
	y=(y-floor(y))*boxsize;
	if(y>=boxsize) y=0.;//rounding of tiny negative offsets
	return y;
}

extern void AssignTasks(HPInt worker_id, HPInt nworkers, HPInt ntasks, HPInt &task_begin, HPInt &task_end);

#endif
