using namespace std;
#include <iostream>
#include <iomanip>
#include <fstream>
#include <string>
#include <cstdlib>
#include <sys/stat.h>
#include <omp.h>

#include "src/datatypes.h"
#include "src/config_parser.h"
#include "src/logger.h"
#include "src/mpi_wrapper.h"
#include "src/mymath.h"
#include "src/snapshot.h"
#include "src/chunk_planner.h"
#include "src/halo.h"
#include "src/halo_property.h"
#include "src/coordinator.h"

int main(int argc, char **argv)
{
  MPI_Init(&argc, &argv);
  MpiWorker_t world(MPI_COMM_WORLD);
  HPLog.SetRank(world.rank());
#ifdef _OPENMP
  omp_set_max_active_levels(1);
#endif

  try
  {
	if(world.rank()==0)
	{
	  ParseHPParams(argc, argv, HPConfig);
	  mkdir(HPConfig.ScratchDir.c_str(), 0755);
	  HPConfig.DumpParameters();
	}
	HPConfig.BroadCast(world, 0);
	HPLog.SetThreshold(ParseLogLevel(HPConfig.LogLevel));
	HPLog(LogLevel_t::Debug)<<"running on "<<world.HostName<<" with "<<world.size()<<" ranks"<<endl;

	Timer_t timer;
	timer.Tick(world.Communicator);

	SnapshotLayout_t layout;
	layout.Load(world, HPConfig);
	HPConfig.SetBoxSize(layout.Header.BoxSize);
	Cosmology_t cosmology;
	cosmology.Set(layout.Header.ScaleFactor, layout.Header.OmegaM0, layout.Header.OmegaLambda0, layout.Header.HubbleParam);
	CheckChunkPlan(layout, HPConfig.NumberOfChunks);

	HaloCatalogue_t catalogue;
	catalogue.Load(world, HPConfig, cosmology);
	timer.Tick(world.Communicator);

	SnapshotChunkTask_t task(layout, catalogue, HPConfig);
	GlobalAccumulator_t accumulator(world.rank()==0?catalogue.size():0, HPConfig.NumberOfChunks);
	Coordinator_t coordinator(world, HPConfig, layout, task, accumulator);
	coordinator.Run();
	timer.Tick(world.Communicator);

	if(world.rank()==0)
	{
	  HaloPropertyCatalogue_t properties;
	  properties.Compile(catalogue, accumulator.Halos, cosmology, HPConfig);
	  properties.Save(HPConfig.OutputPath.Build(HPConfig.SnapshotNumber), cosmology, HPConfig, coordinator.Summary);
	}
	timer.Tick(world.Communicator);

	if(world.rank()==0)
	{
	  ofstream time_log(HPConfig.ScratchDir+"/timing.log", fstream::out|fstream::app);
	  time_log<<fixed<<setprecision(1);
	  time_log<<HPConfig.SnapshotNumber;
	  for(int i=1;i<timer.Size();i++)
		time_log<<"\t"<<timer.GetSeconds(i);
	  time_log<<endl;
	}
  }
  catch(const exception &e)
  {
	HPLog(LogLevel_t::Error)<<e.what()<<endl;
	MPI_Abort(MPI_COMM_WORLD, 1);
  }

  MPI_Finalize();
  return 0;
}
