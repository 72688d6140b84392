#include <iostream>
#include <sstream>
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cmath>

#include "snapshot.h"
#include "mymath.h"
#include "logger.h"

void Cosmology_t::Set(double scalefactor, double omega0, double omegaLambda0, double h)
{
  OmegaM0=omega0;
  OmegaLambda0=omegaLambda0;
  HubbleParam=h;
  ScaleFactor=scalefactor;
  double H0=PhysicalConst::H0*h;
  Hz=H0*sqrt(OmegaM0/(ScaleFactor*ScaleFactor*ScaleFactor)
	+(1-OmegaM0-OmegaLambda0)/(ScaleFactor*ScaleFactor)
	+OmegaLambda0);//Hubble param for the current snapshot

  CriticalDensity=3.*Hz*Hz/(8.*M_PI*PhysicalConst::G)*ScaleFactor*ScaleFactor*ScaleFactor;
  MeanDensity=OmegaM0*3.*H0*H0/(8.*M_PI*PhysicalConst::G);
}

void create_SnapshotHeader_MPI_type(MPI_Datatype &dtype)
{
  /*to create the struct data type for communication*/
  SnapshotHeader_t p;
  #define NumAttr 7
  MPI_Datatype oldtypes[NumAttr];
  int blockcounts[NumAttr];
  MPI_Aint   offsets[NumAttr], origin,extent;

  MPI_Get_address(&p,&origin);
  MPI_Get_address((&p)+1,&extent);//to get the extent of s
  extent-=origin;

  int i=0;
  #define RegisterAttr(x, type, count) {MPI_Get_address(&(p.x), offsets+i); offsets[i]-=origin; oldtypes[i]=type; blockcounts[i]=count; i++;}
  RegisterAttr(NumberOfFiles, MPI_INT, 1)
  RegisterAttr(BoxSize, MPI_DOUBLE, 1)
  RegisterAttr(ScaleFactor, MPI_DOUBLE, 1)
  RegisterAttr(OmegaM0, MPI_DOUBLE, 1)
  RegisterAttr(OmegaLambda0, MPI_DOUBLE, 1)
  RegisterAttr(HubbleParam, MPI_DOUBLE, 1)
  RegisterAttr(NumPartTotal[0], MPI_HP_INT, TypeMax)
  #undef RegisterAttr

  MPI_Type_create_struct(i,blockcounts,offsets,oldtypes, &dtype);
  MPI_Type_create_resized(dtype,(MPI_Aint)0, extent, &dtype);
  MPI_Type_commit(&dtype);
  #undef NumAttr
}

const char *PartTypeGroupName(int itype)
{
  static const char *names[TypeMax]={"PartType0", "PartType1", "PartType2", "PartType3", "PartType4", "PartType5", "PartType6"};
  return names[itype];
}

const char *MassDatasetName(int itype)
{
  if(itype==TypeBH) return "DynamicalMasses";
  return "Masses";
}

void SnapshotLayout_t::SetCounts(int nfiles, const vector<HPInt> &counts)
{
  if(counts.size()!=(size_t)nfiles*TypeMax)
	throw ReadError_t("particle counts do not match the number of snapshot files");
  Header.NumberOfFiles=nfiles;
  NumPartFileType=counts;
  CompileOffsets();
}

void SnapshotLayout_t::CompileOffsets()
{
  NumberOfParticles=::CompileOffsets(NumPartFileType, OffsetFileType);

  HPInt ntot[TypeMax]={0};
  for(int ifile=0;ifile<Header.NumberOfFiles;ifile++)
	for(int itype=0;itype<TypeMax;itype++)
	  ntot[itype]+=GetCount(ifile, itype);
  for(int itype=0;itype<TypeMax;itype++)
	Header.NumPartTotal[itype]=ntot[itype];
}

void SnapshotLayout_t::Load(MpiWorker_t &world, const Parameter_t &config, int root)
/*root reads the headers of all the snapshot files; the layout is then broadcast.
 * a reading failure on root is raised on every rank.*/
{
  bool failed=false;
  string message;
  if(world.rank()==root)
  {
	try
	{
	  ReadFiles(config);
	}
	catch(const ReadError_t &e)
	{
	  failed=true;
	  message=e.what();
	}
  }
  if(world.SyncFailure(failed, message, root))
	throw ReadError_t("failed to load snapshot layout. "+message);

  MPI_Datatype MPI_SnapshotHeader_t;
  create_SnapshotHeader_MPI_type(MPI_SnapshotHeader_t);
  MPI_Bcast(&Header, 1, MPI_SnapshotHeader_t, root, world.Communicator);
  My_Type_free(&MPI_SnapshotHeader_t);
  world.SyncContainer(NumPartFileType, MPI_HP_INT, root);
  CompileOffsets();

  HPLog.Root(LogLevel_t::Info)<<NumberOfParticles<<" particles in "<<Header.NumberOfFiles<<" snapshot files, box size "<<Header.BoxSize<<", scale factor "<<Header.ScaleFactor<<endl;
}
