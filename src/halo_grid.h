#ifndef HALO_GRID_HEADER_INCLUDED
#define HALO_GRID_HEADER_INCLUDED

#include <vector>

#include "datatypes.h"
#include "mymath.h"
#include "halo.h"

class HaloGrid_t
/* linked-list cell grid over the halo centres of potential.
 * used to find all the halos whose ReadRadius sphere contains a given point.
 * the halo indices returned refer to the position of the halos in the input vector.*/
{
private:
  int NDiv, NDiv2;
  bool PeriodicBoundary;
  HPReal BoxSize, BoxHalf;
  HPReal Range[3][2];
  HPReal Step[3];
  HPReal MaxRadius;
  const vector <HaloEntry_t> *Halos;
  int RoundGridId(int i) const;
  int ShiftGridId(int i) const;
  int FixGridId(int i) const;
  HPInt Sub2Ind(int i, int j, int k) const;
  HPReal Distance2(const HPxyz &x, const HPxyz &y) const;
public:
  static const int MaxNDiv=128;
  vector <HPInt> HOC;
  vector <HPInt> List;
  HaloGrid_t(): NDiv(0), NDiv2(0), PeriodicBoundary(false), BoxSize(0.), BoxHalf(0.), MaxRadius(0.), Halos(nullptr)
  {
  }
  HaloGrid_t(const vector <HaloEntry_t> &halos, HPReal boxsize=0., bool periodic=false): HaloGrid_t()
  {
	build(halos, boxsize, periodic);
  }
  void build(const vector <HaloEntry_t> &halos, HPReal boxsize=0., bool periodic=false);
  void SearchHalos(const HPxyz &x, vector <LocatedHalo_t> &found) const;
  int GetNDiv() const
  {
	return NDiv;
  }
};

inline int HaloGrid_t::RoundGridId(int i) const
//to correct for rounding error near boundary
{
  return i<0?0:(i>=NDiv?NDiv-1:i);
}
inline int HaloGrid_t::ShiftGridId(int i) const
/*to correct for periodic conditions*/
{
  i=i%NDiv;
  if(i<0) i+=NDiv;
  return i;
}
inline int HaloGrid_t::FixGridId(int i) const
{
  if(PeriodicBoundary)
	return ShiftGridId(i);
  return RoundGridId(i);
}
inline HPInt HaloGrid_t::Sub2Ind(int i, int j, int k) const
{
  return i+j*NDiv+k*NDiv2;
}

#endif
