#include <iostream>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <string>

#include "../halo_property.h"
#include "../hdf_wrapper.h"
#include "../config_parser.h"
#include "../logger.h"

static void InsertSphereMembers(hid_t dtype, size_t offset, const string &suffix, hid_t H5T_HPxyz, hid_t H5T_DoubleArray_TypeMax)
{
  #define InsertMember(name,x,t) H5Tinsert(dtype, (string(name)+suffix).c_str(), offset+HOFFSET(SphereProperty_t, x), t)
  InsertMember("M", Mass, H5T_NATIVE_DOUBLE);
  InsertMember("R", Radius, H5T_NATIVE_FLOAT);
  InsertMember("MassType", MassType, H5T_DoubleArray_TypeMax);
  InsertMember("CentreOfMass", CentreOfMass, H5T_HPxyz);
  InsertMember("CentreOfMassVelocity", CentreOfMassVelocity, H5T_HPxyz);
  InsertMember("HotGasMass", HotGasMass, H5T_NATIVE_DOUBLE);
  InsertMember("HotGasTemperature", HotGasTemperature, H5T_NATIVE_FLOAT);
  InsertMember("XrayLuminosity", XrayLuminosity, H5T_NATIVE_DOUBLE);
  InsertMember("XrayPhotonLuminosity", XrayPhotonLuminosity, H5T_NATIVE_DOUBLE);
  InsertMember("ComptonY", ComptonY, H5T_NATIVE_DOUBLE);
  InsertMember("StellarInitialMass", StellarInitialMass, H5T_NATIVE_DOUBLE);
  InsertMember("BHSubgridMass", BHSubgridMass, H5T_NATIVE_DOUBLE);
  #undef InsertMember
}

void HaloPropertyCatalogue_t::BuildHDFDataType()
{
  H5T_HaloPropertyInMem=H5Tcreate(H5T_COMPOUND, sizeof (HaloProperty_t));
  hsize_t dims[1]={3};
  hid_t H5T_HPxyz=H5Tarray_create2(H5T_HPReal, 1, dims);
  dims[0]=TypeMax;
  hid_t H5T_HPIntArray_TypeMax=H5Tarray_create2(H5T_HPInt, 1, dims);
  hid_t H5T_DoubleArray_TypeMax=H5Tarray_create2(H5T_NATIVE_DOUBLE, 1, dims);

  #define InsertMember(x,t) H5Tinsert(H5T_HaloPropertyInMem, #x, HOFFSET(HaloProperty_t, x), t)
  //the members of each overdensity sphere are stored flat, named after the member with the overdensity appended
  #define InsertSphere(so,suffix) InsertSphereMembers(H5T_HaloPropertyInMem, HOFFSET(HaloProperty_t, so), suffix, H5T_HPxyz, H5T_DoubleArray_TypeMax)
  InsertMember(HaloId, H5T_HPInt);
  InsertMember(HostHaloId, H5T_HPInt);
  InsertMember(CentreOfPotential, H5T_HPxyz);
  InsertMember(RadiusSize, H5T_NATIVE_FLOAT);
  InsertMember(SearchRadius, H5T_NATIVE_FLOAT);
  InsertMember(NumPart, H5T_HPInt);
  InsertMember(NumPartType, H5T_HPIntArray_TypeMax);
  InsertMember(Mass, H5T_NATIVE_DOUBLE);
  InsertMember(MassType, H5T_DoubleArray_TypeMax);
  InsertMember(CentreOfMass, H5T_HPxyz);
  InsertMember(CentreOfMassVelocity, H5T_HPxyz);
  InsertMember(MassInRadius, H5T_NATIVE_DOUBLE);
  InsertMember(NumPartInRadius, H5T_HPInt);
  InsertMember(HotGasMass, H5T_NATIVE_DOUBLE);
  InsertMember(HotGasTemperature, H5T_NATIVE_FLOAT);
  InsertSphere(SO200Crit, "200Crit");
  InsertSphere(SO500Crit, "500Crit");
  InsertSphere(SO200Mean, "200Mean");
  #undef InsertMember
  #undef InsertSphere
  H5T_HaloPropertyInDisk=H5Tcopy(H5T_HaloPropertyInMem);
  H5Tpack(H5T_HaloPropertyInDisk); //clear padding

  H5Tclose(H5T_DoubleArray_TypeMax);
  H5Tclose(H5T_HPIntArray_TypeMax);
  H5Tclose(H5T_HPxyz);
}

HaloPropertyCatalogue_t::~HaloPropertyCatalogue_t()
{
  H5Tclose(H5T_HaloPropertyInDisk);
  H5Tclose(H5T_HaloPropertyInMem);
}

void HaloPropertyCatalogue_t::WriteFile(hid_t file, const Cosmology_t &cosmology, const Parameter_t &config, const RunSummary_t &summary) const
{
  hsize_t ndim=1, dim_atom[]={1};
  writeHDFmatrix(file, &config.SnapshotNumber, "SnapshotNumber", ndim, dim_atom, H5T_NATIVE_INT);
  HPInt nhalo=Properties.size();
  writeHDFmatrix(file, &nhalo, "NumberOfHalos", ndim, dim_atom, H5T_HPInt);
  writeHDFmatrix(file, &summary.NumberOfChunks, "NumberOfChunks", ndim, dim_atom, H5T_HPInt);
  writeHDFmatrix(file, &summary.NumberOfParticles, "NumberOfParticles", ndim, dim_atom, H5T_HPInt);
  writeHDFmatrix(file, &summary.NumberOfSkippedParticles, "NumberOfSkippedParticles", ndim, dim_atom, H5T_HPInt);

  hsize_t dim_sub[]={Properties.size()};
  writeHDFmatrix(file, Properties.data(), "HaloProperties", ndim, dim_sub, H5T_HaloPropertyInMem, H5T_HaloPropertyInDisk);
  if(H5LTset_attribute_string(file, "HaloProperties", "Comment", "one record per halo of the input catalogue, in catalogue order")<0)
	throw WriteError_t("failed writing comment to "+GetObjectPath(file));

  {
	HDFHandle_t cosmology_group(H5Gcreate2(file, "/Cosmology", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT), H5Gclose);
	if(cosmology_group<0)
	  throw WriteError_t("cannot create group /Cosmology in "+GetObjectPath(file));
	writeHDFmatrix(cosmology_group, &cosmology.ScaleFactor, "ScaleFactor", ndim, dim_atom, H5T_NATIVE_DOUBLE);
	writeHDFmatrix(cosmology_group, &cosmology.OmegaM0, "OmegaM0", ndim, dim_atom, H5T_NATIVE_DOUBLE);
	writeHDFmatrix(cosmology_group, &cosmology.OmegaLambda0, "OmegaLambda0", ndim, dim_atom, H5T_NATIVE_DOUBLE);
	writeHDFmatrix(cosmology_group, &cosmology.HubbleParam, "HubbleParam", ndim, dim_atom, H5T_NATIVE_DOUBLE);
	writeHDFmatrix(cosmology_group, &config.BoxSize, "BoxSize", ndim, dim_atom, H5T_HPReal);
  }

  vector <pair <string, string> > units={
	{"LengthUnit", "comoving "+to_string(config.LengthInMpc)+" Mpc"},
	{"MassUnit", to_string(config.MassInMsun)+" Msun"},
	{"VelocityUnit", to_string(config.VelInKmS)+" km/s"},
	{"TemperatureUnit", "K"},
	{"Version", HP_VERSION}
  };
  for(auto &&unit: units)
	if(SetStringAttribute(file, ".", unit.first.c_str(), unit.second.c_str())<0)
	  throw WriteError_t("failed writing attribute "+unit.first+" to "+GetObjectPath(file));

  HDFHandle_t parameter_group(H5Gcreate2(file, "/Parameters", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT), H5Gclose);
  if(parameter_group<0)
	throw WriteError_t("cannot create group /Parameters in "+GetObjectPath(file));
  for(auto &&par: config.ListParameters())
	if(SetStringAttribute(parameter_group, ".", par.first.c_str(), par.second.c_str())<0)
	  throw WriteError_t("failed writing parameter "+par.first+" to "+GetObjectPath(file));
}

void HaloPropertyCatalogue_t::Save(const string &filename, const Cosmology_t &cosmology, const Parameter_t &config, const RunSummary_t &summary) const
/* the file is written under a temporary name, and only renamed to filename after it has been closed successfully.
 * on any failure the temporary file is removed and nothing is left at filename.*/
{
  string tmpname=filename+".tmp";
  hid_t file=H5Fcreate(tmpname.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  if(file<0)
	throw WriteError_t("cannot create output file "+tmpname);
  try
  {
	WriteFile(file, cosmology, config, summary);
  }
  catch(const exception &)
  {
	H5Fclose(file);
	remove(tmpname.c_str());
	throw;
  }
  if(H5Fclose(file)<0)
  {
	remove(tmpname.c_str());
	throw WriteError_t("failed to close output file "+tmpname);
  }
  if(rename(tmpname.c_str(), filename.c_str())!=0)
  {
	string reason=strerror(errno);
	remove(tmpname.c_str());
	throw WriteError_t("cannot move "+tmpname+" to "+filename+": "+reason);
  }
  HPLog.Root(LogLevel_t::Info)<<Properties.size()<<" halo property records saved to "<<filename<<endl;
}
