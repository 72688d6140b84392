#include <iostream>
#include <vector>
#include <string>

#include "test_helper.h"
#include "mock_simulation.h"
#include "../mpi_wrapper.h"
#include "../config_parser.h"
#include "../halo.h"
#include "../hdf_wrapper.h"
#include "../logger.h"

static void AddHalos(MockSimulation_t &sim, int nhalo)
{
  sim.Halos.clear();
  for(int i=0;i<nhalo;i++)
  {
	MockHalo_t h;
	h.Id=1000+3*i;
	h.HostId=(i%4==3)?1000:-1;
	for(int j=0;j<3;j++)
	{
	  h.CentreOfPotential[j]=1.+i+j;
	  h.CentreOfMass[j]=h.CentreOfPotential[j]+(j==0?0.3:0.);
	}
	h.RadiusSize=0.1*(i+1);
	sim.Halos.push_back(h);
  }
}

static void WriteOnRoot(MpiWorker_t &world, const MockSimulation_t &sim, int nfiles)
{
  MPI_Barrier(world.Communicator);
  if(world.rank()==0)
  {
	RemoveFile(sim.CatalogueBaseName());
	for(int i=0;i<8;i++)
	  RemoveFile(sim.CatalogueBaseName()+"."+to_string(i));
	sim.WriteCatalogue(nfiles);
  }
  MPI_Barrier(world.Communicator);
}

static void CheckHalos(const HaloCatalogue_t &catalogue, const MockSimulation_t &sim, double length_conversion)
{
  CHECK_EQUAL(catalogue.size(), (HPInt)sim.Halos.size());
  if(catalogue.size()!=sim.Halos.size()) return;
  for(HPInt i=0;i<catalogue.size();i++)
  {
	const HaloEntry_t &h=catalogue.Halos[i];
	const MockHalo_t &q=sim.Halos[i];
	CHECK_EQUAL(h.HaloId, q.Id);
	CHECK_EQUAL(h.HostHaloId, q.HostId<0?SpecialConst::NullHaloId:q.HostId);
	CHECK_EQUAL(catalogue.GetIndex(q.Id), i);
	for(int j=0;j<3;j++)
	{
	  CHECK_CLOSE(h.CentreOfPotential[j], q.CentreOfPotential[j]*length_conversion, 1e-6);
	  CHECK_CLOSE(h.CentreOfMass[j], q.CentreOfMass[j]*length_conversion, 1e-6);
	}
	CHECK_CLOSE(h.RadiusSize, q.RadiusSize*length_conversion, 1e-6);
	CHECK_CLOSE(h.SearchRadius, (1.01*q.RadiusSize+0.3)*length_conversion, 1e-5);
	CHECK(h.ReadRadius>=h.SearchRadius);
  }
  CHECK_EQUAL(catalogue.GetIndex(999), -1);
}

static void TestLoad(MpiWorker_t &world, MockSimulation_t &sim)
{
  Cosmology_t cosmology;
  cosmology.Set(1., sim.OmegaM0, sim.OmegaLambda0, sim.HubbleParam);

  for(int nfiles: {0, 1, 3, 5})
  {
	WriteOnRoot(world, sim, nfiles);
	Parameter_t config;
	sim.Configure(config);
	config.SetBoxSize(sim.BoxSize);
	HaloCatalogue_t catalogue;
	catalogue.Load(world, config, cosmology);
	CHECK_EQUAL(catalogue.GetNumberOfFiles(), nfiles==0?1:nfiles);
	CheckHalos(catalogue, sim, 1.);
  }

  {//physical kpc at a=0.5 become comoving Mpc
	sim.LengthUnitToKpc=1.;
	WriteOnRoot(world, sim, 2);
	sim.LengthUnitToKpc=1000.;
	Cosmology_t early;
	early.Set(0.5, sim.OmegaM0, sim.OmegaLambda0, sim.HubbleParam);
	Parameter_t config;
	sim.Configure(config);
	config.SetBoxSize(sim.BoxSize);
	HaloCatalogue_t catalogue;
	catalogue.Load(world, config, early);
	CHECK_EQUAL(catalogue.Units.ComovingOrPhysical, 0);
	CHECK_CLOSE(catalogue.Units.LengthUnitToKpc, 1., 1e-12);
	CheckHalos(catalogue, sim, 2e-3);
  }

  {//comoving units with h
	sim.ComovingOrPhysical=1;
	WriteOnRoot(world, sim, 0);
	sim.ComovingOrPhysical=0;
	Parameter_t config;
	sim.Configure(config);
	config.SetBoxSize(sim.BoxSize);
	HaloCatalogue_t catalogue;
	catalogue.Load(world, config, cosmology);
	CHECK_EQUAL(catalogue.Units.ComovingOrPhysical, 1);
	CHECK_CLOSE(catalogue.Units.HubbleParam, sim.HubbleParam, 1e-12);
	CHECK_CLOSE(catalogue.Units.MassToSolarMass(), 0.7e10, 1e-12);
	CheckHalos(catalogue, sim, sim.HubbleParam);
  }

  {//a minimum read radius extends the spheres but not the search radius
	WriteOnRoot(world, sim, 0);
	Parameter_t config;
	sim.Configure(config, {"MinReadRadius 8"});
	config.SetBoxSize(sim.BoxSize);
	HaloCatalogue_t catalogue;
	catalogue.Load(world, config, cosmology);
	for(auto &&h: catalogue.Halos)
	{
	  CHECK(h.SearchRadius<8.);
	  CHECK_CLOSE(h.ReadRadius, 8., 1e-6);
	}
  }
}

static void TestMissing(MpiWorker_t &world, MockSimulation_t &sim)
{
  Cosmology_t cosmology;
  cosmology.Set(1., sim.OmegaM0, sim.OmegaLambda0, sim.HubbleParam);
  MockSimulation_t other(sim.Dir);
  other.SnapshotNumber=sim.SnapshotNumber+10;
  Parameter_t config;
  other.Configure(config);
  config.SetBoxSize(sim.BoxSize);
  HaloCatalogue_t catalogue;
  CHECK_THROW(catalogue.Load(world, config, cosmology), MissingCatalogueError_t);
}

static void TestShortColumn(MpiWorker_t &world, MockSimulation_t &sim)
/*a column shorter than ID is a reading error, and leaves no file open*/
{
  Cosmology_t cosmology;
  cosmology.Set(1., sim.OmegaM0, sim.OmegaLambda0, sim.HubbleParam);
  WriteOnRoot(world, sim, 0);
  if(world.rank()==0)
  {
	hid_t file=H5Fopen(sim.CatalogueBaseName().c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
	H5Ldelete(file, "R_size", H5P_DEFAULT);
	vector <double> rsize(sim.Halos.size()-1, 1.);
	hsize_t dims[1]={rsize.size()};
	writeHDFmatrix(file, rsize.data(), "R_size", 1, dims, H5T_NATIVE_DOUBLE);
	H5Fclose(file);
  }
  MPI_Barrier(world.Communicator);
  Parameter_t config;
  sim.Configure(config);
  config.SetBoxSize(sim.BoxSize);
  for(int attempt=0;attempt<2;attempt++)
  {
	HaloCatalogue_t catalogue;
	CHECK_THROW(catalogue.Load(world, config, cosmology), ReadError_t);
	CHECK_EQUAL(H5Fget_obj_count(H5F_OBJ_ALL, H5F_OBJ_ALL), 0);
  }
}

static void TestSearchRadius()
{
  Parameter_t config;
  config.SetBoxSize(10.);
  HaloEntry_t h;
  h.CentreOfPotential={9.5, 5., 5.};
  h.CentreOfMass={0.5, 5., 5.};
  h.RadiusSize=1.;
  SetSearchRadius(h, config);
  CHECK_CLOSE(h.SearchRadius, 2.01, 1e-6);
  CHECK_CLOSE(h.ReadRadius, 5., 1e-6);//at least 5 Mpc by default
  config.MinReadRadius=0.;
  SetSearchRadius(h, config);
  CHECK_CLOSE(h.ReadRadius, 2.01, 1e-6);
  config.PeriodicBoundaryOn=false;
  SetSearchRadius(h, config);
  CHECK_CLOSE(h.SearchRadius, 10.01, 1e-6);
}

int main(int argc, char **argv)
{
  MPI_Init(&argc, &argv);
  int status=0;
  {
	MpiWorker_t world(MPI_COMM_WORLD);
	HPLog.SetRank(world.rank());
	HPLog.SetThreshold(LogLevel_t::Warning);

	MockSimulation_t sim("test_catalogue_data");
	AddHalos(sim, 13);
	if(world.rank()==0)
	  MakeDirectory(sim.Dir);
	MPI_Barrier(world.Communicator);

	TestLoad(world, sim);
	TestMissing(world, sim);
	TestShortColumn(world, sim);
	TestSearchRadius();

	status=TestReport("test_catalogue", world.rank());
	MPI_Allreduce(MPI_IN_PLACE, &status, 1, MPI_INT, MPI_MAX, world.Communicator);
  }
  MPI_Finalize();
  return status;
}
