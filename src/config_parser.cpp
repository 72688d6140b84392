#include <cstdlib>
#include "config_parser.h"
#include "logger.h"

namespace PhysicalConst
{
double G;
double H0;
}

Parameter_t HPConfig;

void Parameter_t::SetParameterValue(const string &line)
{
  stringstream ss(line);
  string name;
  ss>>name;
#define TrySetPar(var,i) if(name==#var){ ss>>var; IsSet[i]=true;}
  TrySetPar(SnapshotTemplate,0)
  else TrySetPar(ScratchDir,1)
  else TrySetPar(CatalogueTemplate,2)
  else TrySetPar(OutputTemplate,3)
  else TrySetPar(SnapshotNumber,4)
#undef TrySetPar
#define TrySetPar(var) if(name==#var) ss>>var;
  else TrySetPar(NumberOfChunks)
  else TrySetPar(MembershipTemplate)
  else TrySetPar(MaxRanksReading)
  else TrySetPar(MaxChunkRetries)
  else TrySetPar(ChunkTimeoutSeconds)
  else TrySetPar(InconsistentAssignmentPolicy)
  else TrySetPar(MinReadRadius)
  else TrySetPar(ProfileInnerFraction)
  else TrySetPar(HotGasTemperature)
  else TrySetPar(PeriodicBoundaryOn)
  else TrySetPar(MassInMsun)
  else TrySetPar(LengthInMpc)
  else TrySetPar(VelInKmS)
  else TrySetPar(LogLevel)
#undef TrySetPar
  else
	throw ConfigurationError_t("unrecognized configuration entry: "+name);
  if(ss.fail())
	throw ConfigurationError_t("invalid value for configuration entry "+name+": "+line);
}

void Parameter_t::ParseConfigFile(const char * param_file)
{
  ifstream ifs;
  ifs.open(param_file);
  if(!ifs.is_open())
	throw ConfigurationError_t(string("failed to open configuration: ")+param_file);
  string line;

  HPLog.Root(LogLevel_t::Info)<<"Reading configuration file "<<param_file<<endl;

  while(getline(ifs,line))
  {
	trim_trailing_garbage(line, "#");
	trim_leading_garbage(line, " \t");
	if(!line.empty()) SetParameterValue(line);
  }
}

void Parameter_t::CheckUnsetParameters()
{
  const char *names[NumberOfCompulsaryConfigEntries]={"SnapshotTemplate", "ScratchDir", "CatalogueTemplate", "OutputTemplate", "SnapshotNumber"};
  for(int i=0;i<IsSet.size();i++)
  {
	if(!IsSet[i])
	  throw ConfigurationError_t(string("compulsory entry ")+names[i]+" missing");
  }
}

void Parameter_t::ParseTemplates()
{
  SnapshotPath.Parse(SnapshotTemplate);
  if(!SnapshotPath.HasFileNumber())
	throw ConfigurationError_t("snapshot template "+SnapshotTemplate+" has no %(file_nr)d placeholder");
  CataloguePath.Parse(CatalogueTemplate);
  if(CataloguePath.HasFileNumber())
	throw ConfigurationError_t("catalogue template "+CatalogueTemplate+" must not contain %(file_nr)d; file numbers are appended to the .properties suffix");
  OutputPath.Parse(OutputTemplate);
  if(OutputPath.HasFileNumber())
	throw ConfigurationError_t("output template "+OutputTemplate+" must not contain %(file_nr)d; output is a single file");
  if(HasMembership())
  {
	MembershipPath.Parse(MembershipTemplate);
	if(!MembershipPath.HasFileNumber())
	  throw ConfigurationError_t("membership template "+MembershipTemplate+" has no %(file_nr)d placeholder");
  }
  else
	MembershipPath=PathTemplate_t();
}

void Parameter_t::CheckParameters()
/*validate everything before any work starts, and fill derived parameters*/
{
  CheckUnsetParameters();
  if(SnapshotNumber<0)
	throw ConfigurationError_t("snapshot number must be non-negative, got "+to_string(SnapshotNumber));
  if(NumberOfChunks<=0)
	throw ConfigurationError_t("number of chunks must be at least 1, got "+to_string(NumberOfChunks));
  if(MaxRanksReading<=0)
	throw ConfigurationError_t("max-ranks-reading must be at least 1, got "+to_string(MaxRanksReading));
  if(MaxChunkRetries<0)
	throw ConfigurationError_t("MaxChunkRetries must be non-negative");
  if(ChunkTimeoutSeconds<0)
	throw ConfigurationError_t("ChunkTimeoutSeconds must be non-negative");
  if(MinReadRadius<0)
	throw ConfigurationError_t("MinReadRadius must be non-negative");
  if(!(ProfileInnerFraction>0&&ProfileInnerFraction<1))
	throw ConfigurationError_t("ProfileInnerFraction must be in (0,1)");
  if(!(MassInMsun>0&&LengthInMpc>0&&VelInKmS>0))
	throw ConfigurationError_t("unit conversion factors must be positive");
  if(InconsistentAssignmentPolicy=="abort")
	AssignmentPolicy=AssignmentPolicy_t::Abort;
  else if(InconsistentAssignmentPolicy=="skip")
	AssignmentPolicy=AssignmentPolicy_t::Skip;
  else
	throw ConfigurationError_t("InconsistentAssignmentPolicy must be abort or skip, got "+InconsistentAssignmentPolicy);
  ParseLogLevel(LogLevel);
  ParseTemplates();

  //G=4.30091727e-9 Mpc (km/s)^2/Msun
  PhysicalConst::G=4.30091727e-9*MassInMsun/VelInKmS/VelInKmS/LengthInMpc;
  PhysicalConst::H0=100.*(1./VelInKmS)/(1./LengthInMpc);
}

string HPUsage(const char *program)
{
  stringstream msg;
  msg<<"Usage: "<<program<<" <snapshot_template> <scratch_dir> <catalogue_template> <output_template> <snap_nr>"
     <<" [--chunks=N] [--extra-input=<membership_template>] [--max-ranks-reading=N] [--config=<param_file>] [--Key=Value ...]";
  return msg.str();
}

void ParseHPParams(int argc, char **argv, Parameter_t &config)
/*positional arguments fill the compulsory entries; options override the parameter file given by --config.*/
{
  const char *compulsory[NumberOfCompulsaryConfigEntries]={"SnapshotTemplate", "ScratchDir", "CatalogueTemplate", "OutputTemplate", "SnapshotNumber"};
  vector <string> positional, options;
  string param_file;
  for(int i=1;i<argc;i++)
  {
	string arg=argv[i];
	if(arg.compare(0, 2, "--")!=0)
	{
	  positional.push_back(arg);
	  continue;
	}
	auto eq=arg.find('=');
	if(eq==string::npos)
	  throw ConfigurationError_t("option "+arg+" requires a value\n"+HPUsage(argv[0]));
	string key=arg.substr(2, eq-2), value=arg.substr(eq+1);
	if(key=="chunks") key="NumberOfChunks";
	else if(key=="extra-input") key="MembershipTemplate";
	else if(key=="max-ranks-reading") key="MaxRanksReading";
	if(key=="config")
	  param_file=value;
	else
	  options.push_back(key+" "+value);
  }
  if(positional.size()!=NumberOfCompulsaryConfigEntries)
	throw ConfigurationError_t("expect "+to_string(NumberOfCompulsaryConfigEntries)+" positional arguments, got "+to_string(positional.size())+"\n"+HPUsage(argv[0]));

  if(!param_file.empty())
	config.ParseConfigFile(param_file.c_str());
  for(int i=0;i<NumberOfCompulsaryConfigEntries;i++)
	config.SetParameterValue(string(compulsory[i])+" "+positional[i]);
  for(auto &&opt: options)
	config.SetParameterValue(opt);
  config.CheckParameters();
  HPLog.Root(LogLevel_t::Info)<<"Running "<<argv[0]<<" on snapshot "<<config.SnapshotNumber<<" with "<<config.NumberOfChunks<<" chunks"<<endl;
}

void Parameter_t::BroadCast(MpiWorker_t &world, int root)
/*sync parameters and physical consts across*/
{
  #define _SyncVec(x,t) world.SyncContainer(x,t,root)
  #define _SyncAtom(x,t) world.SyncAtom(x,t,root)
  #define _SyncBool(x) world.SyncAtomBool(x, root)
  #define _SyncVecBool(x) world.SyncVectorBool(x, root)
  #define _SyncReal(x) _SyncAtom(x, MPI_HP_REAL)

  _SyncVec(SnapshotTemplate, MPI_CHAR);
  _SyncVec(ScratchDir, MPI_CHAR);
  _SyncVec(CatalogueTemplate, MPI_CHAR);
  _SyncVec(OutputTemplate, MPI_CHAR);
  _SyncAtom(SnapshotNumber, MPI_INT);
  _SyncVecBool(IsSet);

  _SyncAtom(NumberOfChunks, MPI_INT);
  _SyncVec(MembershipTemplate, MPI_CHAR);
  _SyncAtom(MaxRanksReading, MPI_INT);
  _SyncAtom(MaxChunkRetries, MPI_INT);
  _SyncAtom(ChunkTimeoutSeconds, MPI_DOUBLE);
  _SyncVec(InconsistentAssignmentPolicy, MPI_CHAR);
  _SyncReal(MinReadRadius);
  _SyncReal(ProfileInnerFraction);
  _SyncReal(HotGasTemperature);
  _SyncBool(PeriodicBoundaryOn);
  _SyncAtom(MassInMsun, MPI_DOUBLE);
  _SyncAtom(LengthInMpc, MPI_DOUBLE);
  _SyncAtom(VelInKmS, MPI_DOUBLE);
  _SyncVec(LogLevel, MPI_CHAR);

  int policy=static_cast<int>(AssignmentPolicy);
  _SyncAtom(policy, MPI_INT);
  AssignmentPolicy=static_cast<AssignmentPolicy_t>(policy);
  _SyncReal(BoxSize);
  _SyncReal(BoxHalf);
  //---------------end sync params-------------------------//

  _SyncAtom(PhysicalConst::G, MPI_DOUBLE);
  _SyncAtom(PhysicalConst::H0, MPI_DOUBLE);

  #undef _SyncVec
  #undef _SyncAtom
  #undef _SyncBool
  #undef _SyncVecBool
  #undef _SyncReal

  if(world.rank()!=root)
	ParseTemplates();
}

vector <pair<string, string> > Parameter_t::ListParameters() const
{
  vector <pair<string, string> > pars;
#define ListPar(var) {stringstream ss; ss<<var; pars.emplace_back(#var, ss.str());}
  ListPar(SnapshotTemplate)
  ListPar(ScratchDir)
  ListPar(CatalogueTemplate)
  ListPar(OutputTemplate)
  ListPar(SnapshotNumber)

  ListPar(NumberOfChunks)
  if(HasMembership())
	ListPar(MembershipTemplate)
  ListPar(MaxRanksReading)
  ListPar(MaxChunkRetries)
  ListPar(ChunkTimeoutSeconds)
  ListPar(InconsistentAssignmentPolicy)
  ListPar(MinReadRadius)
  ListPar(ProfileInnerFraction)
  ListPar(HotGasTemperature)
  ListPar(PeriodicBoundaryOn)
  ListPar(MassInMsun)
  ListPar(LengthInMpc)
  ListPar(VelInKmS)
  ListPar(LogLevel)
#undef ListPar
  return pars;
}

void Parameter_t::DumpParameters()
{
  string filename=ScratchDir+"/VER"+HP_VERSION+".param";
  ofstream version_file(filename, ios::out|ios::trunc);
  if(!version_file.is_open())
	throw ConfigurationError_t("cannot open "+filename+" for parameter dump; check ScratchDir");
  for(auto &&par: ListParameters())
	version_file<<par.first<<"  "<<par.second<<endl;
  version_file<<"#BoxSize  "<<BoxSize<<endl;
  version_file.close();
}
