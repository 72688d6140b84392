#ifndef CHUNK_AGGREGATOR_H_INCLUDED
#define CHUNK_AGGREGATOR_H_INCLUDED

#include <vector>

#include "datatypes.h"
#include "config_parser.h"
#include "snapshot.h"
#include "halo.h"
#include "halo_grid.h"
#include "halo_property.h"

class ChunkAggregator_t
/* accumulates the particles of one chunk into partial sums for the halos they touch.
 *
 * a particle contributes to the spherical quantities (mass within RadiusSize, radial profile) of every halo whose
 * ReadRadius sphere contains it. It is a member of the halo named by its HostHaloId when membership files are given,
 * or otherwise of every halo whose SearchRadius sphere contains it.*/
{
  const HaloCatalogue_t &Catalogue;
  const HaloGrid_t &Grid;
  const Parameter_t &Config;
  vector <HPInt> Slot;//position of each halo in Touched, or -1
  vector <HaloAccumulator_t> Touched;
  vector <LocatedHalo_t> Located;
  HaloAccumulator_t & GetAccumulator(HPInt ihalo);
public:
  HPInt NumberOfParticles;
  HPInt NumberOfSkippedParticles;
  ChunkAggregator_t(const HaloCatalogue_t &catalogue, const HaloGrid_t &grid, const Parameter_t &config);
  void Add(const Particle_t &p);
  void Finish(vector <HaloAccumulator_t> &partial);//partial sums sorted by halo index; resets the aggregator
};

#endif
