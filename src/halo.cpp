#include <iostream>
#include <sstream>
#include <cmath>

#include "halo.h"
#include "logger.h"

void create_MPI_HaloEntry_type(MPI_Datatype &dtype)
{
  /*to create the struct data type for communication*/
  HaloEntry_t p;
  #define NumAttr 7
  MPI_Datatype oldtypes[NumAttr];
  int blockcounts[NumAttr];
  MPI_Aint   offsets[NumAttr], origin,extent;

  MPI_Get_address(&p,&origin);
  MPI_Get_address((&p)+1,&extent);//to get the extent of s
  extent-=origin;

  int i=0;
  #define RegisterAttr(x, type, count) {MPI_Get_address(&(p.x), offsets+i); offsets[i]-=origin; oldtypes[i]=type; blockcounts[i]=count; i++;}
  RegisterAttr(HaloId, MPI_HP_INT, 1)
  RegisterAttr(HostHaloId, MPI_HP_INT, 1)
  RegisterAttr(CentreOfPotential[0], MPI_HP_REAL, 3)
  RegisterAttr(CentreOfMass[0], MPI_HP_REAL, 3)
  RegisterAttr(RadiusSize, MPI_HP_REAL, 1)
  RegisterAttr(SearchRadius, MPI_HP_REAL, 1)
  RegisterAttr(ReadRadius, MPI_HP_REAL, 1)
  #undef RegisterAttr

  MPI_Type_create_struct(i,blockcounts,offsets,oldtypes, &dtype);
  MPI_Type_create_resized(dtype,(MPI_Aint)0, extent, &dtype);
  MPI_Type_commit(&dtype);
  #undef NumAttr
}

double CatalogueUnits_t::LengthToComovingMpc(double scalefactor) const
{
  if(ComovingOrPhysical==0)
	return (1./scalefactor)*LengthUnitToKpc/1000.;
  return HubbleParam*LengthUnitToKpc/1000.;
}

double CatalogueUnits_t::MassToSolarMass() const
{
  if(ComovingOrPhysical==0)
	return MassUnitToSolarMass;
  return HubbleParam*MassUnitToSolarMass;
}

void SetSearchRadius(HaloEntry_t &halo, const Parameter_t &config)
/*the search radius about the centre of potential must enclose every particle within RadiusSize of the centre of mass*/
{
  double d2=0.;
  for(int j=0;j<3;j++)
  {
	double dx=fabs(halo.CentreOfPotential[j]-halo.CentreOfMass[j]);
	if(config.PeriodicBoundaryOn&&dx>0.5*config.BoxSize)
	  dx=config.BoxSize-dx;
	d2+=dx*dx;
  }
  halo.SearchRadius=halo.RadiusSize*1.01+sqrt(d2);
  halo.ReadRadius=max(halo.SearchRadius, config.MinReadRadius);
}

void HaloCatalogue_t::SetHalos(const vector <HaloEntry_t> &halos)
{
  Halos=halos;
  FillIndexTable();
}

void HaloCatalogue_t::FillIndexTable()
{
  IndexTable.clear();
  IndexTable.reserve(Halos.size());
  for(HPInt i=0;i<Halos.size();i++)
  {
	if(!IndexTable.emplace(Halos[i].HaloId, i).second)
	  throw ReadError_t("duplicate halo id "+to_string(Halos[i].HaloId)+" in catalogue "+BaseName);
  }
}
