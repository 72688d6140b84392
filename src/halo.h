#ifndef HALO_H_INCLUDED
#define HALO_H_INCLUDED

#include <climits>
#include <iostream>
#include <algorithm>
#include <unordered_map>

#include "datatypes.h"
#include "snapshot.h"
#include "mpi_wrapper.h"
#include "config_parser.h"

/*a halo of the input catalogue, in internal comoving units*/
struct HaloEntry_t
{
  HPInt HaloId;
  HPInt HostHaloId;//NullHaloId for field halos
  HPxyz CentreOfPotential;
  HPxyz CentreOfMass;
  HPReal RadiusSize;//radius about CentreOfMass that contains every member
  HPReal SearchRadius;//radius about CentreOfPotential that contains every member
  HPReal ReadRadius;//radius about CentreOfPotential out to which spherical quantities are measured
};
extern void create_MPI_HaloEntry_type(MPI_Datatype &dtype);

struct CatalogueUnits_t
{
  int ComovingOrPhysical;//0 for physical units without h, otherwise comoving 1/h units
  double LengthUnitToKpc;
  double MassUnitToSolarMass;
  double HubbleParam;
  double LengthToComovingMpc(double scalefactor) const;
  double MassToSolarMass() const;
};

class HaloCatalogue_t
{
  unordered_map <HPInt, HPInt> IndexTable;
  int NumberOfFiles;
  bool SingleFile;
  string BaseName;
  string GetFileName(int ifile) const;
  void Locate(const Parameter_t &config);
  void ReadFile(int ifile, double length_conversion, vector <HaloEntry_t> &halos) const;
  void ReadUnits();
public:
  vector <HaloEntry_t> Halos;
  CatalogueUnits_t Units;

  HaloCatalogue_t(): NumberOfFiles(0), SingleFile(true)
  {
  }
  void Load(MpiWorker_t &world, const Parameter_t &config, const Cosmology_t &cosmology);
  void SetHalos(const vector <HaloEntry_t> &halos);
  void FillIndexTable();
  HPInt size() const
  {
	return Halos.size();
  }
  HPInt GetIndex(HPInt halo_id) const
  /*index of the halo in the catalogue, or -1 if the id is unknown*/
  {
	auto it=IndexTable.find(halo_id);
	if(it==IndexTable.end()) return -1;
	return it->second;
  }
  int GetNumberOfFiles() const
  {
	return NumberOfFiles;
  }
};

extern void SetSearchRadius(HaloEntry_t &halo, const Parameter_t &config);

#endif
