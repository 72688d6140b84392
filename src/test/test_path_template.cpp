#include <iostream>
#include <string>

#include "test_helper.h"
#include "../path_template.h"
#include "../config_parser.h"
#include "../errors.h"
#include "../logger.h"

static void TestTemplates()
{
  PathTemplate_t snapshot("snapshots/flamingo_%(snap_nr)04d/flamingo_%(snap_nr)04d.%(file_nr)d.hdf5");
  CHECK_EQUAL(snapshot.Build(77, 12), "snapshots/flamingo_0077/flamingo_0077.12.hdf5");
  CHECK(snapshot.HasSnapshotNumber());
  CHECK(snapshot.HasFileNumber());

  PathTemplate_t catalogue("VR/catalogue_%(snap_nr)04d/vr_catalogue_%(snap_nr)04d");
  CHECK_EQUAL(catalogue.Build(5), "VR/catalogue_0005/vr_catalogue_0005");
  CHECK(!catalogue.HasFileNumber());

  PathTemplate_t padded("out_%(snap_nr)5d_%%_%(file_nr)02d");
  CHECK_EQUAL(padded.Build(3, 4), "out_    3_%_04");

  PathTemplate_t wide("x%(snap_nr)02d");
  CHECK_EQUAL(wide.Build(1234), "x1234");

  PathTemplate_t literal("plain/path.hdf5");
  CHECK_EQUAL(literal.Build(1, 2), "plain/path.hdf5");
  CHECK(!literal.HasSnapshotNumber());

  PathTemplate_t t;
  CHECK_THROW(t.Parse(""), ConfigurationError_t);
  CHECK_THROW(t.Parse("a_%(snapnr)d"), ConfigurationError_t);
  CHECK_THROW(t.Parse("a_%(snap_nr"), ConfigurationError_t);
  CHECK_THROW(t.Parse("a_%(snap_nr)04s"), ConfigurationError_t);
  CHECK_THROW(t.Parse("a_%(snap_nr)"), ConfigurationError_t);
  CHECK_THROW(t.Parse("a_%d"), ConfigurationError_t);
  CHECK_THROW(t.Parse("a_%"), ConfigurationError_t);
}

static void SetCompulsory(Parameter_t &config, const string &snapshot, const string &catalogue, const string &output)
{
  config.SetParameterValue("SnapshotTemplate "+snapshot);
  config.SetParameterValue("ScratchDir /tmp");
  config.SetParameterValue("CatalogueTemplate "+catalogue);
  config.SetParameterValue("OutputTemplate "+output);
  config.SetParameterValue("SnapshotNumber 18");
}

static void TestParameters()
{
  {
	Parameter_t config;
	SetCompulsory(config, "snap_%(snap_nr)04d.%(file_nr)d.hdf5", "cat_%(snap_nr)04d", "props_%(snap_nr)04d.hdf5");
	config.SetParameterValue("NumberOfChunks 4");
	config.SetParameterValue("InconsistentAssignmentPolicy skip");
	config.CheckParameters();
	CHECK_EQUAL(config.NumberOfChunks, 4);
	CHECK_EQUAL(config.MaxRanksReading, 10);
	CHECK(config.AssignmentPolicy==AssignmentPolicy_t::Skip);
	CHECK(!config.HasMembership());
	CHECK_EQUAL(config.SnapshotPath.Build(config.SnapshotNumber, 3), "snap_0018.3.hdf5");
	CHECK_EQUAL(config.OutputPath.Build(config.SnapshotNumber), "props_0018.hdf5");
	CHECK(PhysicalConst::G>4.3e-9&&PhysicalConst::G<4.31e-9);
	CHECK_CLOSE(PhysicalConst::H0, 100., 1e-12);
  }
  {//templates are validated before any work starts
	Parameter_t config;
	SetCompulsory(config, "snap_%(snap_nr)04d.hdf5", "cat_%(snap_nr)04d", "props.hdf5");
	CHECK_THROW(config.CheckParameters(), ConfigurationError_t);
  }
  {
	Parameter_t config;
	SetCompulsory(config, "snap.%(file_nr)d", "cat.%(file_nr)d", "props.hdf5");
	CHECK_THROW(config.CheckParameters(), ConfigurationError_t);
  }
  {
	Parameter_t config;
	SetCompulsory(config, "snap.%(file_nr)d", "cat", "props.hdf5");
	config.SetParameterValue("MembershipTemplate member.hdf5");
	CHECK_THROW(config.CheckParameters(), ConfigurationError_t);
  }
  {
	Parameter_t config;
	SetCompulsory(config, "snap.%(file_nr)d", "cat", "props.hdf5");
	config.SetParameterValue("NumberOfChunks 0");
	CHECK_THROW(config.CheckParameters(), ConfigurationError_t);
  }
  {
	Parameter_t config;
	SetCompulsory(config, "snap.%(file_nr)d", "cat", "props.hdf5");
	config.SetParameterValue("InconsistentAssignmentPolicy ignore");
	CHECK_THROW(config.CheckParameters(), ConfigurationError_t);
  }
  {
	Parameter_t config;
	SetCompulsory(config, "snap.%(file_nr)d", "cat", "props.hdf5");
	config.SetParameterValue("LogLevel verbose");
	CHECK_THROW(config.CheckParameters(), ConfigurationError_t);
  }
  {
	Parameter_t config;
	config.SetParameterValue("SnapshotTemplate snap.%(file_nr)d");
	CHECK_THROW(config.CheckParameters(), ConfigurationError_t);
	CHECK_THROW(config.SetParameterValue("NoSuchParameter 1"), ConfigurationError_t);
	CHECK_THROW(config.SetParameterValue("NumberOfChunks many"), ConfigurationError_t);
  }
}

static void TestCommandLine()
{
  {
	const char *args[]={"compute_halo_properties", "snap_%(snap_nr)04d.%(file_nr)d.hdf5", "/tmp/scratch", "cat_%(snap_nr)04d",
	  "props_%(snap_nr)04d.hdf5", "77", "--chunks=8", "--extra-input=member_%(snap_nr)04d.%(file_nr)d.hdf5",
	  "--max-ranks-reading=128", "--MaxChunkRetries=5"};
	Parameter_t config;
	ParseHPParams(sizeof(args)/sizeof(args[0]), const_cast<char **>(args), config);
	CHECK_EQUAL(config.SnapshotNumber, 77);
	CHECK_EQUAL(config.ScratchDir, "/tmp/scratch");
	CHECK_EQUAL(config.NumberOfChunks, 8);
	CHECK_EQUAL(config.MaxRanksReading, 128);
	CHECK_EQUAL(config.MaxChunkRetries, 5);
	CHECK(config.HasMembership());
	CHECK_EQUAL(config.MembershipPath.Build(77, 1), "member_0077.1.hdf5");
  }
  {
	const char *args[]={"compute_halo_properties", "snap.%(file_nr)d", "/tmp", "cat"};
	Parameter_t config;
	CHECK_THROW(ParseHPParams(sizeof(args)/sizeof(args[0]), const_cast<char **>(args), config), ConfigurationError_t);
  }
  {
	const char *args[]={"compute_halo_properties", "snap.%(file_nr)d", "/tmp", "cat", "out", "1", "--chunks"};
	Parameter_t config;
	CHECK_THROW(ParseHPParams(sizeof(args)/sizeof(args[0]), const_cast<char **>(args), config), ConfigurationError_t);
  }
  {
	const char *args[]={"compute_halo_properties", "snap.%(file_nr)d", "/tmp", "cat", "out", "1", "--chunks=-2"};
	Parameter_t config;
	CHECK_THROW(ParseHPParams(sizeof(args)/sizeof(args[0]), const_cast<char **>(args), config), ConfigurationError_t);
  }
}

int main(int argc, char **argv)
{
  HPLog.SetThreshold(LogLevel_t::Warning);
  TestTemplates();
  TestParameters();
  TestCommandLine();
  return TestReport("test_path_template");
}
