#include <iostream>
#include <cmath>
#include <algorithm>

#include "halo_property.h"
#include "config_parser.h"
#include "logger.h"

void ProfileBin_t::Reset()
{
  for(int i=0;i<TypeMax;i++)
	MassType[i].Reset();
  for(int j=0;j<3;j++)
  {
	MassWeightedOffset[j].Reset();
	MassWeightedVelocity[j].Reset();
  }
  HotGasMass.Reset();
  HotGasMassTemperature.Reset();
  XrayLuminosity.Reset();
  XrayPhotonLuminosity.Reset();
  ComptonY.Reset();
  StellarInitialMass.Reset();
  BHSubgridMass.Reset();
}

void ProfileBin_t::Merge(const ProfileBin_t &other)
{
  for(int i=0;i<TypeMax;i++)
	MassType[i].Merge(other.MassType[i]);
  for(int j=0;j<3;j++)
  {
	MassWeightedOffset[j].Merge(other.MassWeightedOffset[j]);
	MassWeightedVelocity[j].Merge(other.MassWeightedVelocity[j]);
  }
  HotGasMass.Merge(other.HotGasMass);
  HotGasMassTemperature.Merge(other.HotGasMassTemperature);
  XrayLuminosity.Merge(other.XrayLuminosity);
  XrayPhotonLuminosity.Merge(other.XrayPhotonLuminosity);
  ComptonY.Merge(other.ComptonY);
  StellarInitialMass.Merge(other.StellarInitialMass);
  BHSubgridMass.Merge(other.BHSubgridMass);
}

void ProfileBin_t::Add(const Particle_t &p, const double dx[3], HPReal hot_gas_temperature)
{
  double m=p.Mass;
  MassType[p.Type].Add(m);
  for(int j=0;j<3;j++)
  {
	MassWeightedOffset[j].Add(m*dx[j]);
	MassWeightedVelocity[j].Add(m*p.Velocity[j]);
  }
  switch(p.Type)
  {
	case TypeGas:
	  if(p.Temperature>hot_gas_temperature)
	  {
		HotGasMass.Add(m);
		HotGasMassTemperature.Add(m*p.Temperature);
	  }
	  XrayLuminosity.Add(p.XrayLuminosity);
	  XrayPhotonLuminosity.Add(p.XrayPhotonLuminosity);
	  ComptonY.Add(p.ComptonY);
	  break;
	case TypeStar:
	  StellarInitialMass.Add(p.InitialMass);
	  break;
	case TypeBH:
	  BHSubgridMass.Add(p.SubgridMass);
	  break;
	default:
	  break;
  }
}

double ProfileBin_t::Mass() const
{
  CompensatedSum_t m;
  m.Reset();
  for(int i=0;i<TypeMax;i++)
	m.Merge(MassType[i]);
  return m.Value();
}

void HaloAccumulator_t::Reset(HPInt index)
{
  HaloIndex=index;
  for(int i=0;i<TypeMax;i++)
  {
	NumPartType[i]=0;
	MassType[i].Reset();
  }
  for(int j=0;j<3;j++)
  {
	MassWeightedVelocity[j].Reset();
	MassWeightedOffset[j].Reset();
  }
  NumPartInRadius=0;
  MassInRadius.Reset();
  HotGasMass.Reset();
  HotGasMassTemperature.Reset();
  for(int k=0;k<NumRadialBins;k++)
	Profile[k].Reset();
}

void HaloAccumulator_t::Merge(const HaloAccumulator_t &other)
{
  for(int i=0;i<TypeMax;i++)
  {
	NumPartType[i]+=other.NumPartType[i];
	MassType[i].Merge(other.MassType[i]);
  }
  for(int j=0;j<3;j++)
  {
	MassWeightedVelocity[j].Merge(other.MassWeightedVelocity[j]);
	MassWeightedOffset[j].Merge(other.MassWeightedOffset[j]);
  }
  NumPartInRadius+=other.NumPartInRadius;
  MassInRadius.Merge(other.MassInRadius);
  HotGasMass.Merge(other.HotGasMass);
  HotGasMassTemperature.Merge(other.HotGasMassTemperature);
  for(int k=0;k<NumRadialBins;k++)
	Profile[k].Merge(other.Profile[k]);
}

void HaloAccumulator_t::AddMember(const Particle_t &p, const double dx[3], HPReal hot_gas_temperature)
{
  double m=p.Mass;
  NumPartType[p.Type]++;
  MassType[p.Type].Add(m);
  for(int j=0;j<3;j++)
  {
	MassWeightedVelocity[j].Add(m*p.Velocity[j]);
	MassWeightedOffset[j].Add(m*dx[j]);
  }
  if(p.Type==TypeGas&&p.Temperature>hot_gas_temperature)
  {
	HotGasMass.Add(m);
	HotGasMassTemperature.Add(m*p.Temperature);
  }
}

void HaloAccumulator_t::AddToSphere(const Particle_t &p, const double dx[3], double r, HPReal radius_size, const RadialBins_t &bins, HPReal hot_gas_temperature)
{
  if(r<radius_size)
  {
	NumPartInRadius++;
	MassInRadius.Add(p.Mass);
  }
  int k=bins.GetBin(r);
  if(k>=0)
	Profile[k].Add(p, dx, hot_gas_temperature);
}

HPInt HaloAccumulator_t::GetNumPart() const
{
  HPInt n=0;
  for(int i=0;i<TypeMax;i++)
	n+=NumPartType[i];
  return n;
}

void create_MPI_HaloAccumulator_type(MPI_Datatype &dtype)
{
  /*to create the struct data type for communication*/
  HaloAccumulator_t p;
  #define NumAttr 11
  MPI_Datatype oldtypes[NumAttr];
  int blockcounts[NumAttr];
  MPI_Aint   offsets[NumAttr], origin,extent;

  MPI_Get_address(&p,&origin);
  MPI_Get_address((&p)+1,&extent);//to get the extent of s
  extent-=origin;

  int i=0;
  #define RegisterAttr(x, type, count) {MPI_Get_address(&(p.x), offsets+i); offsets[i]-=origin; oldtypes[i]=type; blockcounts[i]=count; i++;}
  //each CompensatedSum_t is a pair of doubles
  RegisterAttr(HaloIndex, MPI_HP_INT, 1)
  RegisterAttr(NumPartType[0], MPI_HP_INT, TypeMax)
  RegisterAttr(MassType[0], MPI_DOUBLE, 2*TypeMax)
  RegisterAttr(MassWeightedVelocity[0], MPI_DOUBLE, 2*3)
  RegisterAttr(MassWeightedOffset[0], MPI_DOUBLE, 2*3)
  RegisterAttr(NumPartInRadius, MPI_HP_INT, 1)
  RegisterAttr(MassInRadius, MPI_DOUBLE, 2)
  RegisterAttr(HotGasMass, MPI_DOUBLE, 2)
  RegisterAttr(HotGasMassTemperature, MPI_DOUBLE, 2)
  RegisterAttr(Profile[0], MPI_DOUBLE, sizeof(p.Profile)/sizeof(double))//the bins hold nothing but doubles
  #undef RegisterAttr

  MPI_Type_create_struct(i,blockcounts,offsets,oldtypes, &dtype);
  MPI_Type_create_resized(dtype,(MPI_Aint)0, extent, &dtype);
  MPI_Type_commit(&dtype);
  #undef NumAttr
}

bool SphericalOverdensitySize(const HaloAccumulator_t &acc, const RadialBins_t &bins, double reference_density, double &Mso, double &Rso, int &nbin_inside)
/* find the radius at which the mean enclosed density first falls from above to below reference_density,
 * interpolating log(density) against log(radius) between bin edges.
 * returns true if the density is still above the threshold at the outermost edge, in which case the outermost edge
 * and the mass inside it are returned, as a lower bound.
 * nbin_inside is the number of leading bins whose outer edge lies within Rso.*/
{
  Mso=0.;
  Rso=0.;
  nbin_inside=0;
  double menc=0., r_prev=0., rho_prev=0.;
  bool above=false;
  for(int k=0;k<NumRadialBins;k++)
  {
	menc+=acc.Profile[k].Mass();
	double r=bins.OuterEdge(k);
	double rho=menc/(4.*M_PI/3.*r*r*r);
	if(rho>reference_density)
	  above=true;
	else if(above)
	{
	  double lr=log(r_prev)+(log(reference_density)-log(rho_prev))*(log(r)-log(r_prev))/(log(rho)-log(rho_prev));
	  Rso=exp(lr);
	  Mso=reference_density*4.*M_PI/3.*Rso*Rso*Rso;
	  nbin_inside=k;
	  return false;
	}
	r_prev=r;
	rho_prev=rho;
  }
  if(above)
  {
	Rso=r_prev;
	Mso=menc;
	nbin_inside=NumRadialBins;
	return true;
  }
  return false;
}

void SphereProperty_t::Clear(const HPxyz &centre)
{
  Mass=0.;
  Radius=0.;
  for(int i=0;i<TypeMax;i++)
	MassType[i]=0.;
  CentreOfMass=centre;
  CentreOfMassVelocity.fill(0.);
  HotGasMass=0.;
  HotGasTemperature=0.;
  XrayLuminosity=XrayPhotonLuminosity=ComptonY=0.;
  StellarInitialMass=BHSubgridMass=0.;
}

bool SphereProperty_t::Compute(const HaloAccumulator_t &acc, const RadialBins_t &bins, double reference_density, const HPxyz &centre, const Parameter_t &config)
/*returns true if the radius is only a lower bound*/
{
  Clear(centre);
  double m, r;
  int nbin;
  bool lowerbound=SphericalOverdensitySize(acc, bins, reference_density, m, r, nbin);
  Mass=m;
  Radius=r;
  if(0==nbin) return lowerbound;

  ProfileBin_t inside;
  inside.Reset();
  for(int k=0;k<nbin;k++)
	inside.Merge(acc.Profile[k]);
  for(int i=0;i<TypeMax;i++)
	MassType[i]=inside.MassType[i].Value();
  double minside=inside.Mass();
  if(minside>0.)
	for(int j=0;j<3;j++)
	{
	  CentreOfMass[j]=centre[j]+inside.MassWeightedOffset[j].Value()/minside;
	  if(config.PeriodicBoundaryOn)
		CentreOfMass[j]=position_modulus(CentreOfMass[j], config.BoxSize);
	  CentreOfMassVelocity[j]=inside.MassWeightedVelocity[j].Value()/minside;
	}
  HotGasMass=inside.HotGasMass.Value();
  if(HotGasMass>0.)
	HotGasTemperature=inside.HotGasMassTemperature.Value()/HotGasMass;
  XrayLuminosity=inside.XrayLuminosity.Value();
  XrayPhotonLuminosity=inside.XrayPhotonLuminosity.Value();
  ComptonY=inside.ComptonY.Value();
  StellarInitialMass=inside.StellarInitialMass.Value();
  BHSubgridMass=inside.BHSubgridMass.Value();
  return lowerbound;
}

int HaloProperty_t::Finalize(const HaloEntry_t &halo, const HaloAccumulator_t &acc, const Cosmology_t &cosmology, const Parameter_t &config)
/*returns the number of overdensity radii that are only lower bounds*/
{
  HaloId=halo.HaloId;
  HostHaloId=halo.HostHaloId;
  CentreOfPotential=halo.CentreOfPotential;
  RadiusSize=halo.RadiusSize;
  SearchRadius=halo.SearchRadius;

  NumPart=0;
  CompensatedSum_t msum;
  msum.Reset();
  for(int i=0;i<TypeMax;i++)
  {
	NumPartType[i]=acc.NumPartType[i];
	NumPart+=NumPartType[i];
	MassType[i]=acc.MassType[i].Value();
	msum.Merge(acc.MassType[i]);
  }
  Mass=msum.Value();

  if(NumPart>0&&Mass>0.)
  {
	for(int j=0;j<3;j++)
	{
	  CentreOfMass[j]=CentreOfPotential[j]+acc.MassWeightedOffset[j].Value()/Mass;
	  if(config.PeriodicBoundaryOn)
		CentreOfMass[j]=position_modulus(CentreOfMass[j], config.BoxSize);
	  CentreOfMassVelocity[j]=acc.MassWeightedVelocity[j].Value()/Mass;
	}
  }
  else
  {
	CentreOfMass=CentreOfPotential;
	CentreOfMassVelocity.fill(0.);
  }

  MassInRadius=acc.MassInRadius.Value();
  NumPartInRadius=acc.NumPartInRadius;
  HotGasMass=acc.HotGasMass.Value();
  if(HotGasMass>0.)
	HotGasTemperature=acc.HotGasMassTemperature.Value()/HotGasMass;
  else
	HotGasTemperature=0.;

  int nlowerbound=0;
  if(halo.ReadRadius>0.)
  {
	RadialBins_t bins(halo.ReadRadius, config.ProfileInnerFraction);
	nlowerbound+=SO200Crit.Compute(acc, bins, 200.*cosmology.CriticalDensity, CentreOfPotential, config);
	nlowerbound+=SO500Crit.Compute(acc, bins, 500.*cosmology.CriticalDensity, CentreOfPotential, config);
	nlowerbound+=SO200Mean.Compute(acc, bins, 200.*cosmology.MeanDensity, CentreOfPotential, config);
  }
  else
  {
	SO200Crit.Clear(CentreOfPotential);
	SO500Crit.Clear(CentreOfPotential);
	SO200Mean.Clear(CentreOfPotential);
  }
  return nlowerbound;
}

void HaloPropertyCatalogue_t::Compile(const HaloCatalogue_t &catalogue, const vector <HaloAccumulator_t> &accumulators, const Cosmology_t &cosmology, const Parameter_t &config)
{
  if(accumulators.size()!=catalogue.Halos.size())
	throw runtime_error("number of accumulated halos ("+to_string(accumulators.size())+") does not match the catalogue ("+to_string(catalogue.Halos.size())+")");
  Properties.resize(catalogue.Halos.size());
  HPInt nlowerbound=0, nempty=0;
#pragma omp parallel for reduction(+:nlowerbound, nempty)
  for(HPInt i=0;i<Properties.size();i++)
  {
	nlowerbound+=Properties[i].Finalize(catalogue.Halos[i], accumulators[i], cosmology, config);
	if(0==Properties[i].NumPart) nempty++;
  }
  if(nlowerbound)
	HPLog.Root(LogLevel_t::Info)<<nlowerbound<<" overdensity radii reach the read radius and are only lower bounds; increase MinReadRadius to resolve them"<<endl;
  if(nempty)
	HPLog.Root(LogLevel_t::Info)<<nempty<<" halos have no member particles"<<endl;
}
