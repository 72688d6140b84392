#include <iostream>
#include <sstream>
#include <string>
#include <cstdlib>

#include "../halo.h"
#include "../hdf_wrapper.h"
#include "../mymath.h"
#include "../logger.h"

string HaloCatalogue_t::GetFileName(int ifile) const
{
  if(SingleFile) return BaseName;
  return BaseName+"."+to_string(ifile);
}

void HaloCatalogue_t::Locate(const Parameter_t &config)
/*single file output is preferred when both forms are present*/
{
  BaseName=config.CataloguePath.Build(config.SnapshotNumber)+".properties";
  if(file_exist(BaseName))
	SingleFile=true;
  else if(file_exist(BaseName+".0"))
	SingleFile=false;
  else
	throw ReadError_t("neither "+BaseName+" nor "+BaseName+".0 exists");

  {
	HDFHandle_t file(OpenFileForRead(GetFileName(0)), H5Fclose);
	if(SingleFile)
	  NumberOfFiles=1;
	else
	  ReadDataset(file, "Num_of_files", H5T_NATIVE_INT, &NumberOfFiles);
  }
  if(NumberOfFiles<=0)
	throw ReadError_t("catalogue "+BaseName+" reports "+to_string(NumberOfFiles)+" files");
}

void HaloCatalogue_t::ReadUnits()
{
  HDFHandle_t file(OpenFileForRead(GetFileName(0)), H5Fclose);
  ReadAttribute(file, "UnitInfo", "Comoving_or_Physical", H5T_NATIVE_INT, &Units.ComovingOrPhysical);
  ReadAttribute(file, "UnitInfo", "Length_unit_to_kpc", H5T_NATIVE_DOUBLE, &Units.LengthUnitToKpc);
  ReadAttribute(file, "UnitInfo", "Mass_unit_to_solarmass", H5T_NATIVE_DOUBLE, &Units.MassUnitToSolarMass);
  ReadAttribute(file, "SimulationInfo", "h_val", H5T_NATIVE_DOUBLE, &Units.HubbleParam);
}

void HaloCatalogue_t::ReadFile(int ifile, double length_conversion, vector <HaloEntry_t> &halos) const
{
  HDFHandle_t file(OpenFileForRead(GetFileName(ifile)), H5Fclose);
  HPInt nhalo=GetDatasetLength(file, "ID");
  const char *columns[]={"hostHaloID", "Xcminpot", "Ycminpot", "Zcminpot", "Xc", "Yc", "Zc", "R_size"};
  for(auto &&name: columns)
	if((HPInt)GetDatasetLength(file, name)!=nhalo)
	  throw ReadError_t("dataset "+string(name)+" in "+GetFileName(ifile)+" does not have one row per halo");
  HPInt offset=halos.size();
  halos.resize(offset+nhalo);
  HaloEntry_t *h=halos.data()+offset;
  {
	vector <HPInt> buf(nhalo);
	ReadDataset(file, "ID", H5T_HPInt, buf.data());
	for(HPInt i=0;i<nhalo;i++)
	  h[i].HaloId=buf[i];
	ReadDataset(file, "hostHaloID", H5T_HPInt, buf.data());
	for(HPInt i=0;i<nhalo;i++)
	  h[i].HostHaloId=buf[i]<0?SpecialConst::NullHaloId:buf[i];
  }
  {
	vector <double> buf(nhalo);
	const char *cofp_names[3]={"Xcminpot", "Ycminpot", "Zcminpot"}, *cofm_names[3]={"Xc", "Yc", "Zc"};
	for(int j=0;j<3;j++)
	{
	  ReadDataset(file, cofp_names[j], H5T_NATIVE_DOUBLE, buf.data());
	  for(HPInt i=0;i<nhalo;i++)
		h[i].CentreOfPotential[j]=buf[i]*length_conversion;
	  ReadDataset(file, cofm_names[j], H5T_NATIVE_DOUBLE, buf.data());
	  for(HPInt i=0;i<nhalo;i++)
		h[i].CentreOfMass[j]=buf[i]*length_conversion;
	}
	ReadDataset(file, "R_size", H5T_NATIVE_DOUBLE, buf.data());
	for(HPInt i=0;i<nhalo;i++)
	  h[i].RadiusSize=buf[i]*length_conversion;
  }
}

void HaloCatalogue_t::Load(MpiWorker_t &world, const Parameter_t &config, const Cosmology_t &cosmology)
{
  const int root=0;
  bool failed=false;
  string message;
  if(world.rank()==root)
  {
	try
	{
	  Locate(config);
	  ReadUnits();
	}
	catch(const ReadError_t &e)
	{
	  failed=true;
	  message=e.what();
	}
  }
  world.SyncContainer(BaseName, MPI_CHAR, root);
  if(world.SyncFailure(failed, message, root))
  {
	HPLog.Root(LogLevel_t::Error)<<message<<endl;
	throw MissingCatalogueError_t(BaseName);
  }
  world.SyncAtom(NumberOfFiles, MPI_INT, root);
  world.SyncAtomBool(SingleFile, root);
  world.SyncAtom(Units.ComovingOrPhysical, MPI_INT, root);
  world.SyncAtom(Units.LengthUnitToKpc, MPI_DOUBLE, root);
  world.SyncAtom(Units.MassUnitToSolarMass, MPI_DOUBLE, root);
  world.SyncAtom(Units.HubbleParam, MPI_DOUBLE, root);

  double length_conversion=Units.LengthToComovingMpc(cosmology.ScaleFactor)/config.LengthInMpc;

  HPInt ifile_begin, ifile_end;
  AssignTasks(world.rank(), world.size(), NumberOfFiles, ifile_begin, ifile_end);
  vector <HaloEntry_t> LocalHalos;
  for(int i=0, ireader=0;i<world.size();i++, ireader++)
  {
	if(ireader==config.MaxRanksReading)
	{
	  ireader=0;//reset reader count
	  MPI_Barrier(world.Communicator);//wait for every thread to arrive.
	}
	if(i==world.rank())//read
	{
	  try
	  {
		for(int ifile=ifile_begin;ifile<ifile_end;ifile++)
		  ReadFile(ifile, length_conversion, LocalHalos);
	  }
	  catch(const ReadError_t &e)
	  {
		failed=true;
		message=e.what();
	  }
	}
  }
  if(world.AnyFailed(failed))
  {
	if(message.empty())
	  message="catalogue "+BaseName+" could not be read on another rank";
	throw ReadError_t(message);
  }

#pragma omp parallel for
  for(HPInt i=0;i<LocalHalos.size();i++)
  {
	auto &h=LocalHalos[i];
	if(config.PeriodicBoundaryOn)
	  for(int j=0;j<3;j++)
	  {
		h.CentreOfPotential[j]=position_modulus(h.CentreOfPotential[j], config.BoxSize);
		h.CentreOfMass[j]=position_modulus(h.CentreOfMass[j], config.BoxSize);
	  }
	SetSearchRadius(h, config);
  }

  MPI_Datatype MPI_HaloEntry_t;
  create_MPI_HaloEntry_type(MPI_HaloEntry_t);
  VectorAllGather(world, LocalHalos, Halos, MPI_HaloEntry_t);
  My_Type_free(&MPI_HaloEntry_t);
  FillIndexTable();

  HPLog.Root(LogLevel_t::Info)<<Halos.size()<<" halos loaded from "<<NumberOfFiles<<" catalogue files of "<<BaseName<<endl;
}
