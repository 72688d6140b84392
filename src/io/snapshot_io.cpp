#include <iostream>
#include <sstream>
#include <string>
#include <cstdlib>
#include <cstdio>

#include "../snapshot.h"
#include "../chunk_planner.h"
#include "../mymath.h"
#include "../logger.h"
#include "membership_io.h"

void SnapshotLayout_t::ReadFiles(const Parameter_t &config)
/*read the header of the first file and the particle counts of every file*/
{
  int snapshot_number=config.SnapshotNumber;
  {
	string filename=config.SnapshotPath.Build(snapshot_number, 0);
	HDFHandle_t file(OpenFileForRead(filename), H5Fclose);
	double boxsize[3];
	ReadAttribute(file, "Header", "NumFilesPerSnapshot", H5T_NATIVE_INT, &Header.NumberOfFiles);
	ReadAttribute(file, "Header", "BoxSize", H5T_NATIVE_DOUBLE, boxsize);
	ReadAttribute(file, "Header", "Scale-factor", H5T_NATIVE_DOUBLE, &Header.ScaleFactor);
	ReadAttribute(file, "Header", "NumPart_Total", H5T_HPInt, Header.NumPartTotal);
	ReadAttribute(file, "Cosmology", "Omega_m", H5T_NATIVE_DOUBLE, &Header.OmegaM0);
	ReadAttribute(file, "Cosmology", "Omega_lambda", H5T_NATIVE_DOUBLE, &Header.OmegaLambda0);
	ReadAttribute(file, "Cosmology", "h", H5T_NATIVE_DOUBLE, &Header.HubbleParam);
	Header.BoxSize=boxsize[0];
  }
  if(Header.NumberOfFiles<=0)
	throw ReadError_t("snapshot reports "+to_string(Header.NumberOfFiles)+" files");

  NumPartFileType.assign(Header.NumberOfFiles*TypeMax, 0);
  for(int ifile=0;ifile<Header.NumberOfFiles;ifile++)
  {
	string filename=config.SnapshotPath.Build(snapshot_number, ifile);
	HDFHandle_t file(OpenFileForRead(filename), H5Fclose);
	ReadAttribute(file, "Header", "NumPart_ThisFile", H5T_HPInt, NumPartFileType.data()+ifile*TypeMax);
  }

  for(int itype=0;itype<TypeMax;itype++)
  {
	HPInt n=0;
	for(int ifile=0;ifile<Header.NumberOfFiles;ifile++)
	  n+=GetCount(ifile, itype);
	if(n!=Header.NumPartTotal[itype])
	{
	  stringstream msg;
	  msg<<"snapshot "<<snapshot_number<<": "<<n<<" particles of type "<<itype<<" found in files, while the header claims "<<Header.NumPartTotal[itype];
	  throw ReadError_t(msg.str());
	}
  }
}

const HPInt ParticleStream_t::BlockSize;

ParticleStream_t::ParticleStream_t(const SnapshotLayout_t &layout, const Chunk_t &chunk, const Parameter_t &config):
Layout(layout), Config(config), Slices(chunk.Slices), iSlice(0), SliceRowsDone(0), BufferPos(0), CurrentFile(-1),
SnapshotFile(-1), MembershipFile(-1), NumberRead(0), Exhausted(false)
{
}

void ParticleStream_t::CloseFiles()
{
  if(SnapshotFile>=0) H5Fclose(SnapshotFile);
  if(MembershipFile>=0) H5Fclose(MembershipFile);
  SnapshotFile=-1;
  MembershipFile=-1;
  CurrentFile=-1;
}

void ParticleStream_t::OpenFile(int ifile)
{
  if(ifile==CurrentFile) return;
  CloseFiles();
  SnapshotFile=OpenFileForRead(Config.SnapshotPath.Build(Config.SnapshotNumber, ifile));
  CurrentFile=ifile;
  if(Config.HasMembership())
  {
	MembershipFile=Membership::OpenFile(Config, ifile);
	for(int itype=0;itype<TypeMax;itype++)
	  Membership::CheckLength(MembershipFile, itype, Layout.GetCount(ifile, itype));
  }
  HPLog(LogLevel_t::Debug)<<"reading snapshot file "<<ifile<<endl;
}

template <class T>
static void ReadOptionalDataset(hid_t particle_data, const char *name, hid_t dtype, HPInt row, HPInt count, vector <T> &buf)
/*fills buf with zeros if name is null or the dataset is absent*/
{
  if(name&&DatasetExists(particle_data, name))
	ReadPartialDataset(particle_data, name, dtype, row, count, buf.data());
  else
	buf.assign(count, T(0));
}

void ParticleStream_t::ReadBlock(const FileSlice_t &slice, HPInt offset, HPInt count)
/*read count particles of the slice starting at row offset (relative to the slice) into the buffer*/
{
  OpenFile(slice.File);
  HDFHandle_t particle_data(H5Gopen2(SnapshotFile, PartTypeGroupName(slice.Type), H5P_DEFAULT), H5Gclose);
  if(particle_data<0)
	throw ReadError_t("cannot open group "+string(PartTypeGroupName(slice.Type))+" in "+GetObjectPath(SnapshotFile));
  HPInt row=slice.Offset+offset;
  Buffer.resize(count);
  {
	vector <HPxyz> x(count);
	ReadPartialDataset(particle_data, "Coordinates", H5T_HPReal, row, count, x.data());
	for(HPInt i=0;i<count;i++)
	{
	  if(Config.PeriodicBoundaryOn)
		for(int j=0;j<3;j++)
		  x[i][j]=position_modulus(x[i][j], Config.BoxSize);
	  Buffer[i].ComovingPosition=x[i];
	}
	ReadPartialDataset(particle_data, "Velocities", H5T_HPReal, row, count, x.data());
	for(HPInt i=0;i<count;i++)
	  Buffer[i].Velocity=x[i];
  }
  {
	vector <HPReal> m(count);
	ReadPartialDataset(particle_data, MassDatasetName(slice.Type), H5T_HPReal, row, count, m.data());
	for(HPInt i=0;i<count;i++)
	  Buffer[i].Mass=m[i];
	ReadOptionalDataset(particle_data, slice.Type==TypeGas?"Temperatures":nullptr, H5T_HPReal, row, count, m);
	for(HPInt i=0;i<count;i++)
	  Buffer[i].Temperature=m[i];
	ReadOptionalDataset(particle_data, slice.Type==TypeStar?"InitialMasses":nullptr, H5T_HPReal, row, count, m);
	for(HPInt i=0;i<count;i++)
	  Buffer[i].InitialMass=m[i];
	ReadOptionalDataset(particle_data, slice.Type==TypeBH?"SubgridMasses":nullptr, H5T_HPReal, row, count, m);
	for(HPInt i=0;i<count;i++)
	  Buffer[i].SubgridMass=m[i];
  }
  {
	bool gas=(slice.Type==TypeGas);
	vector <double> v(count);
	ReadOptionalDataset(particle_data, gas?"XrayLuminosities":nullptr, H5T_NATIVE_DOUBLE, row, count, v);
	for(HPInt i=0;i<count;i++)
	  Buffer[i].XrayLuminosity=v[i];
	ReadOptionalDataset(particle_data, gas?"XrayPhotonLuminosities":nullptr, H5T_NATIVE_DOUBLE, row, count, v);
	for(HPInt i=0;i<count;i++)
	  Buffer[i].XrayPhotonLuminosity=v[i];
	ReadOptionalDataset(particle_data, gas?"ComptonYParameters":nullptr, H5T_NATIVE_DOUBLE, row, count, v);
	for(HPInt i=0;i<count;i++)
	  Buffer[i].ComptonY=v[i];
  }
  {
	vector <HPInt> id(count);
	ReadPartialDataset(particle_data, "ParticleIDs", H5T_HPInt, row, count, id.data());
	for(HPInt i=0;i<count;i++)
	  Buffer[i].Id=id[i];
	if(MembershipFile>=0)
	  Membership::ReadGroupNr(MembershipFile, slice.Type, row, count, id.data());
	else
	  id.assign(count, SpecialConst::NullHaloId);
	for(HPInt i=0;i<count;i++)
	  Buffer[i].HostHaloId=id[i];
  }

  ParticleType_t t=static_cast<ParticleType_t>(slice.Type);
  for(HPInt i=0;i<count;i++)
  {
	Buffer[i].Type=t;
	Buffer[i].Index=slice.GlobalBegin+offset+i;
  }
  BufferPos=0;
}

bool ParticleStream_t::FillBuffer()
{
  while(iSlice<Slices.size())
  {
	const FileSlice_t &slice=Slices[iSlice];
	if(SliceRowsDone<slice.Count)
	{
	  HPInt n=min(BlockSize, slice.Count-SliceRowsDone);
	  ReadBlock(slice, SliceRowsDone, n);
	  SliceRowsDone+=n;
	  return true;
	}
	iSlice++;
	SliceRowsDone=0;
  }
  return false;
}

bool ParticleStream_t::Next(Particle_t &p)
{
  if(Exhausted) return false;
  if(BufferPos>=Buffer.size())
  {
	if(!FillBuffer())
	{
	  Exhausted=true;
	  VectorFree(Buffer);
	  CloseFiles();
	  return false;
	}
  }
  p=Buffer[BufferPos++];
  NumberRead++;
  return true;
}
