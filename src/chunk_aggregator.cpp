#include <iostream>
#include <algorithm>
#include <cmath>

#include "chunk_aggregator.h"
#include "errors.h"
#include "logger.h"

ChunkAggregator_t::ChunkAggregator_t(const HaloCatalogue_t &catalogue, const HaloGrid_t &grid, const Parameter_t &config):
Catalogue(catalogue), Grid(grid), Config(config), Slot(catalogue.size(), -1), NumberOfParticles(0), NumberOfSkippedParticles(0)
{
}

HaloAccumulator_t & ChunkAggregator_t::GetAccumulator(HPInt ihalo)
{
  HPInt &slot=Slot[ihalo];
  if(slot<0)
  {
	slot=Touched.size();
	Touched.emplace_back();
	Touched.back().Reset(ihalo);
  }
  return Touched[slot];
}

void ChunkAggregator_t::Add(const Particle_t &p)
{
  NumberOfParticles++;
  double dx[3];
  HPInt host=-1;
  if(Config.HasMembership()&&p.HostHaloId!=SpecialConst::NullHaloId)
  {
	host=Catalogue.GetIndex(p.HostHaloId);
	if(host<0)
	{
	  if(Config.AssignmentPolicy==AssignmentPolicy_t::Abort)
		throw InconsistentAssignmentError_t(p.Index, p.HostHaloId);
	  NumberOfSkippedParticles++;
	  HPLog(LogLevel_t::Warning)<<"skipping particle "<<p.Index<<" assigned to halo "<<p.HostHaloId<<", which is not in the catalogue"<<endl;
	  return;
	}
	PeriodicOffset(p.ComovingPosition, Catalogue.Halos[host].CentreOfPotential, dx, Config);
	GetAccumulator(host).AddMember(p, dx, Config.HotGasTemperature);
  }

  Grid.SearchHalos(p.ComovingPosition, Located);
  for(auto &&located: Located)
  {
	const HaloEntry_t &halo=Catalogue.Halos[located.index];
	HaloAccumulator_t &acc=GetAccumulator(located.index);
	double r=sqrt(located.d2);
	RadialBins_t bins(halo.ReadRadius, Config.ProfileInnerFraction);
	PeriodicOffset(p.ComovingPosition, halo.CentreOfPotential, dx, Config);
	acc.AddToSphere(p, dx, r, halo.RadiusSize, bins, Config.HotGasTemperature);
	if(!Config.HasMembership()&&r<halo.SearchRadius)
	  acc.AddMember(p, dx, Config.HotGasTemperature);
  }
}

void ChunkAggregator_t::Finish(vector <HaloAccumulator_t> &partial)
{
  sort(Touched.begin(), Touched.end(), [](const HaloAccumulator_t &a, const HaloAccumulator_t &b){return a.HaloIndex<b.HaloIndex;});
  partial.swap(Touched);
  VectorFree(Touched);
  Slot.assign(Catalogue.size(), -1);
}
