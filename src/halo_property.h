/* per-halo partial sums, and the halo properties finalized from them.
 *
 * HaloAccumulator_t holds only sums, so that partial results from different chunks can be merged in any order.
 * HaloProperty_t is the output record, in the field order of the output file.
 */
#ifndef HALO_PROPERTY_H_INCLUDED
#define HALO_PROPERTY_H_INCLUDED

#include <vector>
#include <cmath>

#include "datatypes.h"
#include "snapshot.h"
#include "halo.h"
#include "mpi_wrapper.h"

#define NumRadialBins 32

struct CompensatedSum_t
/*Neumaier summation*/
{
  double Sum;
  double Compensation;
  void Reset()
  {
	Sum=0.;
	Compensation=0.;
  }
  void Add(double x)
  {
	double t=Sum+x;
	if(fabs(Sum)>=fabs(x))
	  Compensation+=(Sum-t)+x;
	else
	  Compensation+=(x-t)+Sum;
	Sum=t;
  }
  void Merge(const CompensatedSum_t &other)
  {
	Add(other.Sum);
	Add(other.Compensation);
  }
  double Value() const
  {
	return Sum+Compensation;
  }
};

class RadialBins_t
/* NumRadialBins bins in radius for a halo with read radius RMax.
 * bin 0 covers [0, RMin); the others are logarithmic between RMin and RMax.*/
{
  double RMin, RMax, LogRatio;
public:
  RadialBins_t(HPReal rmax, HPReal inner_fraction): RMin(rmax*inner_fraction), RMax(rmax)
  {
	LogRatio=log(RMax/RMin);
  }
  int GetBin(double r) const
  /*-1 if r is outside the read radius*/
  {
	if(!(r<RMax)) return -1;
	if(r<RMin) return 0;
	int k=floor((NumRadialBins-1)*log(r/RMin)/LogRatio)+1;
	if(k<1) k=1;
	if(k>NumRadialBins-1) k=NumRadialBins-1;
	return k;
  }
  double OuterEdge(int k) const
  {
	return RMin*exp(LogRatio*k/(NumRadialBins-1));
  }
};

struct ProfileBin_t
/*sums over the particles of one radial bin. members must all be CompensatedSum_t: the MPI type sends the profile as doubles.*/
{
  CompensatedSum_t MassType[TypeMax];
  CompensatedSum_t MassWeightedOffset[3];//offset from CentreOfPotential
  CompensatedSum_t MassWeightedVelocity[3];
  CompensatedSum_t HotGasMass;
  CompensatedSum_t HotGasMassTemperature;
  CompensatedSum_t XrayLuminosity;
  CompensatedSum_t XrayPhotonLuminosity;
  CompensatedSum_t ComptonY;
  CompensatedSum_t StellarInitialMass;
  CompensatedSum_t BHSubgridMass;

  void Reset();
  void Merge(const ProfileBin_t &other);
  void Add(const Particle_t &p, const double dx[3], HPReal hot_gas_temperature);
  double Mass() const;
};

struct HaloAccumulator_t
{
  HPInt HaloIndex;
  HPInt NumPartType[TypeMax];
  CompensatedSum_t MassType[TypeMax];
  CompensatedSum_t MassWeightedVelocity[3];
  CompensatedSum_t MassWeightedOffset[3];//offset from CentreOfPotential
  HPInt NumPartInRadius;
  CompensatedSum_t MassInRadius;
  CompensatedSum_t HotGasMass;
  CompensatedSum_t HotGasMassTemperature;
  ProfileBin_t Profile[NumRadialBins];//from every particle inside ReadRadius

  void Reset(HPInt index);
  void Merge(const HaloAccumulator_t &other);
  void AddMember(const Particle_t &p, const double dx[3], HPReal hot_gas_temperature);
  void AddToSphere(const Particle_t &p, const double dx[3], double r, HPReal radius_size, const RadialBins_t &bins, HPReal hot_gas_temperature);
  HPInt GetNumPart() const;
};
extern void create_MPI_HaloAccumulator_type(MPI_Datatype &dtype);

struct SphereProperty_t
/* quantities inside a spherical overdensity radius. the sums other than Mass run over the radial bins lying inside Radius.*/
{
  double Mass;
  float Radius;
  double MassType[TypeMax];
  HPxyz CentreOfMass;
  HPxyz CentreOfMassVelocity;
  double HotGasMass;
  float HotGasTemperature;
  double XrayLuminosity;
  double XrayPhotonLuminosity;
  double ComptonY;
  double StellarInitialMass;
  double BHSubgridMass;

  bool Compute(const HaloAccumulator_t &acc, const RadialBins_t &bins, double reference_density, const HPxyz &centre, const Parameter_t &config);
  void Clear(const HPxyz &centre);
};

struct HaloProperty_t
{
  HPInt HaloId;
  HPInt HostHaloId;
  HPxyz CentreOfPotential;
  float RadiusSize;
  float SearchRadius;
  HPInt NumPart;
  HPInt NumPartType[TypeMax];
  double Mass;
  double MassType[TypeMax];
  HPxyz CentreOfMass;
  HPxyz CentreOfMassVelocity;
  double MassInRadius;
  HPInt NumPartInRadius;
  double HotGasMass;
  float HotGasTemperature;
  SphereProperty_t SO200Crit;
  SphereProperty_t SO500Crit;
  SphereProperty_t SO200Mean;

  int Finalize(const HaloEntry_t &halo, const HaloAccumulator_t &acc, const Cosmology_t &cosmology, const Parameter_t &config);
};

extern bool SphericalOverdensitySize(const HaloAccumulator_t &acc, const RadialBins_t &bins, double reference_density, double &Mso, double &Rso, int &nbin_inside);

/*summary of a run, stored with the properties*/
struct RunSummary_t
{
  HPInt NumberOfChunks;
  HPInt NumberOfParticles;
  HPInt NumberOfSkippedParticles;
  HPInt NumberOfRetries;
  RunSummary_t(): NumberOfChunks(0), NumberOfParticles(0), NumberOfSkippedParticles(0), NumberOfRetries(0)
  {
  }
};

class HaloPropertyCatalogue_t
{
  hid_t H5T_HaloPropertyInMem, H5T_HaloPropertyInDisk;
  void BuildHDFDataType();
  void WriteFile(hid_t file, const Cosmology_t &cosmology, const Parameter_t &config, const RunSummary_t &summary) const;
public:
  vector <HaloProperty_t> Properties;
  HaloPropertyCatalogue_t()
  {
	BuildHDFDataType();
  }
  ~HaloPropertyCatalogue_t();
  HaloPropertyCatalogue_t(const HaloPropertyCatalogue_t &)=delete;
  HaloPropertyCatalogue_t & operator=(const HaloPropertyCatalogue_t &)=delete;
  void Compile(const HaloCatalogue_t &catalogue, const vector <HaloAccumulator_t> &accumulators, const Cosmology_t &cosmology, const Parameter_t &config);
  void Save(const string &filename, const Cosmology_t &cosmology, const Parameter_t &config, const RunSummary_t &summary) const;
  HPInt size() const
  {
	return Properties.size();
  }
};

#endif
