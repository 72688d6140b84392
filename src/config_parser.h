#ifndef CONFIG_PARSER_H_INCLUDED
#define CONFIG_PARSER_H_INCLUDED

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <stdexcept>
#include <vector>
#include <cmath>
#include "datatypes.h"
#include "mpi_wrapper.h"
#include "path_template.h"
#include "errors.h"

#define HP_VERSION "1.0.0.MPI"

namespace PhysicalConst
{//initialized after reading parameters, in internal units
  extern double G;
  extern double H0;//Hubble constant for h=1
}

enum class AssignmentPolicy_t: int
{
  Abort,//a particle claiming an unknown halo stops the job
  Skip//the particle is dropped with a warning
};

#define NumberOfCompulsaryConfigEntries 5
class Parameter_t
{/*!remember to register members in BroadCast(), SetParameterValue() and DumpParameters() if you change them!*/
public:
  /*compulsory parameters, normally given as positional command line arguments*/
  string SnapshotTemplate;
  string ScratchDir;
  string CatalogueTemplate;
  string OutputTemplate;
  int SnapshotNumber;
  vector <bool> IsSet;

  /*optional*/
  int NumberOfChunks;
  string MembershipTemplate;//empty if no membership (extra input) files
  int MaxRanksReading;
  int MaxChunkRetries;
  double ChunkTimeoutSeconds;//0 to disable
  string InconsistentAssignmentPolicy;
  HPReal MinReadRadius;//in internal length units; 5 Mpc with the default units
  HPReal ProfileInnerFraction;
  HPReal HotGasTemperature;//in K
  bool PeriodicBoundaryOn;
  double MassInMsun;
  double LengthInMpc;
  double VelInKmS;
  string LogLevel;

  /*derived parameters; do not require user input*/
  PathTemplate_t SnapshotPath;
  PathTemplate_t CataloguePath;
  PathTemplate_t OutputPath;
  PathTemplate_t MembershipPath;
  AssignmentPolicy_t AssignmentPolicy;
  HPReal BoxSize;//set from the snapshot header
  HPReal BoxHalf;

  Parameter_t(): IsSet(NumberOfCompulsaryConfigEntries, false)
  {
	SnapshotNumber=0;
	NumberOfChunks=1;
	MaxRanksReading=10;
	MaxChunkRetries=3;
	ChunkTimeoutSeconds=0.;
	InconsistentAssignmentPolicy="abort";
	MinReadRadius=5.;
	ProfileInnerFraction=0.01;
	HotGasTemperature=1e5;
	PeriodicBoundaryOn=true;
	MassInMsun=1.;
	LengthInMpc=1.;
	VelInKmS=1.;
	LogLevel="info";
	AssignmentPolicy=AssignmentPolicy_t::Abort;
	BoxSize=0.;
	BoxHalf=0.;
  }
  void ParseConfigFile(const char * param_file);
  void SetParameterValue(const string &line);
  void CheckUnsetParameters();
  void CheckParameters();
  void ParseTemplates();
  void SetBoxSize(HPReal boxsize)
  {
	BoxSize=boxsize;
	BoxHalf=boxsize/2.;
  }
  bool HasMembership() const
  {
	return !MembershipTemplate.empty();
  }
  void BroadCast(MpiWorker_t &world, int root);
  void DumpParameters();
  vector <pair<string, string> > ListParameters() const;
};

extern Parameter_t HPConfig;
extern void ParseHPParams(int argc, char **argv, Parameter_t &config);
extern string HPUsage(const char *program);
inline void trim_leading_garbage(string &s, const string &garbage_list)
{
  auto pos= s.find_first_not_of(garbage_list);//look for any good staff
  if( string::npos!=pos)
	s.erase(0, pos);
  else //no good staff, clear everything
	s.clear();
}
inline void trim_trailing_garbage(string &s, const string &garbage_list)
{
  auto pos=s.find_first_of(garbage_list);
  if(string::npos!=pos)
	s.erase(pos);
}

inline void PeriodicOffset(const HPxyz &x, const HPxyz &centre, double dx[3], const Parameter_t &config=HPConfig)
/*offset of x from centre, wrapped to the nearest image*/
{
  for(int j=0;j<3;j++)
  {
	dx[j]=x[j]-centre[j];
	if(config.PeriodicBoundaryOn)
	{
	  if(dx[j]>config.BoxHalf) dx[j]-=config.BoxSize;
	  else if(dx[j]<-config.BoxHalf) dx[j]+=config.BoxSize;
	}
  }
}
inline HPReal PeriodicDistance(const HPxyz &x, const HPxyz &y, const Parameter_t &config=HPConfig)
{
	double dx[3];
	PeriodicOffset(x, y, dx, config);
	return sqrt(dx[0]*dx[0]+dx[1]*dx[1]+dx[2]*dx[2]);
}
#endif
