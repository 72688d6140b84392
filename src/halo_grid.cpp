#include <iostream>
#include <cmath>
#include <algorithm>

#include "halo_grid.h"

const int HaloGrid_t::MaxNDiv;

HPReal HaloGrid_t::Distance2(const HPxyz &x, const HPxyz &y) const
{
  HPReal d2=0.;
  for(int j=0;j<3;j++)
  {
	HPReal dx=x[j]-y[j];
	if(PeriodicBoundary)
	  dx=dx>BoxHalf?dx-BoxSize:(dx<-BoxHalf?dx+BoxSize:dx);
	d2+=dx*dx;
  }
  return d2;
}

void HaloGrid_t::build(const vector <HaloEntry_t> &halos, HPReal boxsize, bool periodic)
{
  Halos=&halos;
  PeriodicBoundary=periodic&&boxsize>0;
  BoxSize=boxsize;
  BoxHalf=boxsize/2.;

  MaxRadius=0.;
  for(auto &&h: halos)
	if(h.ReadRadius>MaxRadius) MaxRadius=h.ReadRadius;

  if(PeriodicBoundary)
  {
	for(int j=0;j<3;j++)
	{
	  Range[j][0]=0.;
	  Range[j][1]=BoxSize;
	}
  }
  else
  {
	for(int j=0;j<3;j++)
	{
	  Range[j][0]=halos.empty()?0.:halos[0].CentreOfPotential[j];
	  Range[j][1]=Range[j][0];
	}
	for(auto &&h: halos)
	  for(int j=0;j<3;j++)
	  {
		if(h.CentreOfPotential[j]<Range[j][0]) Range[j][0]=h.CentreOfPotential[j];
		if(h.CentreOfPotential[j]>Range[j][1]) Range[j][1]=h.CentreOfPotential[j];
	  }
  }

  HPReal extent=0.;
  for(int j=0;j<3;j++)
	extent=max(extent, Range[j][1]-Range[j][0]);
  if(MaxRadius>0.)
	NDiv=min<HPReal>(extent/MaxRadius, MaxNDiv);
  else
	NDiv=MaxNDiv;
  if(NDiv<1) NDiv=1;
  NDiv2=NDiv*NDiv;
  for(int j=0;j<3;j++)
  {
	Step[j]=(Range[j][1]-Range[j][0])/NDiv;
	if(Step[j]<=0.) Step[j]=1.;
  }

  HOC.assign(NDiv2*NDiv, -1);
  List.resize(halos.size());
  for(HPInt i=halos.size()-1;i>=0;i--)
  {
	int subid[3];
	for(int j=0;j<3;j++)
	  subid[j]=FixGridId(floor((halos[i].CentreOfPotential[j]-Range[j][0])/Step[j]));
	HPInt cell=Sub2Ind(subid[0], subid[1], subid[2]);
	List[i]=HOC[cell];
	HOC[cell]=i;
  }
}

void HaloGrid_t::SearchHalos(const HPxyz &x, vector <LocatedHalo_t> &found) const
/*find every halo with |x-CentreOfPotential|<ReadRadius*/
{
  found.clear();
  if(nullptr==Halos||Halos->empty()) return;
  int imin[3], imax[3];
  for(int j=0;j<3;j++)
  {
	imin[j]=floor((x[j]-MaxRadius-Range[j][0])/Step[j]);
	imax[j]=floor((x[j]+MaxRadius-Range[j][0])/Step[j]);
	if(PeriodicBoundary)
	{
	  if(imax[j]-imin[j]+1>=NDiv)
	  {
		imin[j]=0;
		imax[j]=NDiv-1;
	  }
	}
	else
	{
	  imin[j]=RoundGridId(imin[j]);
	  imax[j]=RoundGridId(imax[j]);
	}
  }
  const vector <HaloEntry_t> &halos=*Halos;
  for(int k=imin[2];k<=imax[2];k++)
	for(int j=imin[1];j<=imax[1];j++)
	  for(int i=imin[0];i<=imax[0];i++)
	  {
		HPInt pid=HOC[Sub2Ind(FixGridId(i), FixGridId(j), FixGridId(k))];
		while(pid>=0)
		{
		  HPReal rmax=halos[pid].ReadRadius;
		  HPReal d2=Distance2(x, halos[pid].CentreOfPotential);
		  if(d2<rmax*rmax)
			found.emplace_back(pid, d2);
		  pid=List[pid];
		}
	  }
}
