#include <iostream>
#include <vector>
#include <cmath>

#include "test_helper.h"
#include "../config_parser.h"
#include "../snapshot.h"
#include "../halo.h"
#include "../halo_property.h"
#include "../logger.h"

static Particle_t MakeParticle(HPInt index, int type, double mass, double x, double y, double z, double vx=0., double temperature=0.)
{
  Particle_t p;
  p.Index=index;
  p.Id=index+1;
  p.Type=static_cast<ParticleType_t>(type);
  p.Mass=mass;
  p.ComovingPosition={(HPReal)x, (HPReal)y, (HPReal)z};
  p.Velocity={(HPReal)vx, 0., 0.};
  p.Temperature=temperature;
  p.XrayLuminosity=p.XrayPhotonLuminosity=p.ComptonY=0.;
  p.InitialMass=p.SubgridMass=0.;
  p.HostHaloId=SpecialConst::NullHaloId;
  return p;
}

static void TestCompensatedSum()
{
  CompensatedSum_t s;
  s.Reset();
  s.Add(1.);
  s.Add(1e100);
  s.Add(1.);
  s.Add(-1e100);
  CHECK_EQUAL(s.Value(), 2.);

  CompensatedSum_t a, b;
  a.Reset();
  b.Reset();
  double naive=0.;
  for(int i=0;i<1000000;i++)
  {
	a.Add(0.1);
	naive+=0.1;
  }
  b.Add(1e8);
  b.Merge(a);
  CHECK_CLOSE(a.Value(), 1e5, 1e-15);
  CHECK(fabs(a.Value()-1e5)<=fabs(naive-1e5));
  CHECK_CLOSE(b.Value(), 1e8+1e5, 1e-15);
}

static void FillAccumulator(HaloAccumulator_t &acc, int seed, const RadialBins_t &bins)
{
  acc.Reset(3);
  for(int i=0;i<200;i++)
  {
	int k=(i*37+seed*101)%997;
	double m=1e-3*(1+k%13)+(seed==1?1e7:0.);
	double r=0.01*(k%500);
	Particle_t p=MakeParticle(i, k%TypeMax, m, r, 0., 0., 0.1*(k%17)-0.8, 1e4*(k%31));
	double dx[3]={r, 0., 0.};
	acc.AddMember(p, dx, 1e5);
	p.XrayLuminosity=(p.Type==TypeGas)?1e40*(1+k%7):0.;
	acc.AddToSphere(p, dx, r, 2.5, bins, 1e5);
  }
}

static void CheckSameSums(const HaloAccumulator_t &a, const HaloAccumulator_t &b)
{
  CHECK_EQUAL(a.HaloIndex, b.HaloIndex);
  CHECK_EQUAL(a.GetNumPart(), b.GetNumPart());
  CHECK_EQUAL(a.NumPartInRadius, b.NumPartInRadius);
  for(int i=0;i<TypeMax;i++)
  {
	CHECK_EQUAL(a.NumPartType[i], b.NumPartType[i]);
	CHECK_CLOSE(a.MassType[i].Value(), b.MassType[i].Value(), 1e-12);
  }
  for(int j=0;j<3;j++)
  {
	CHECK_CLOSE(a.MassWeightedVelocity[j].Value(), b.MassWeightedVelocity[j].Value(), 1e-14);
	CHECK_CLOSE(a.MassWeightedOffset[j].Value(), b.MassWeightedOffset[j].Value(), 1e-14);
  }
  CHECK_CLOSE(a.MassInRadius.Value(), b.MassInRadius.Value(), 1e-14);
  CHECK_CLOSE(a.HotGasMass.Value(), b.HotGasMass.Value(), 1e-14);
  CHECK_CLOSE(a.HotGasMassTemperature.Value(), b.HotGasMassTemperature.Value(), 1e-14);
  for(int k=0;k<NumRadialBins;k++)
  {
	CHECK_CLOSE(a.Profile[k].Mass(), b.Profile[k].Mass(), 1e-14);
	CHECK_CLOSE(a.Profile[k].MassWeightedOffset[0].Value(), b.Profile[k].MassWeightedOffset[0].Value(), 1e-14);
	CHECK_CLOSE(a.Profile[k].HotGasMassTemperature.Value(), b.Profile[k].HotGasMassTemperature.Value(), 1e-14);
	CHECK_CLOSE(a.Profile[k].XrayLuminosity.Value(), b.Profile[k].XrayLuminosity.Value(), 1e-14);
  }
}

static void TestMergeOrder()
{
  RadialBins_t bins(5., 0.01);
  HaloAccumulator_t x, y, z;
  FillAccumulator(x, 0, bins);
  FillAccumulator(y, 1, bins);
  FillAccumulator(z, 2, bins);

  HaloAccumulator_t left=x;//(x+y)+z
  left.Merge(y);
  left.Merge(z);
  HaloAccumulator_t yz=y;//x+(y+z)
  yz.Merge(z);
  HaloAccumulator_t right=x;
  right.Merge(yz);
  HaloAccumulator_t reversed=z;//z+y+x
  reversed.Merge(y);
  reversed.Merge(x);
  CheckSameSums(left, right);
  CheckSameSums(left, reversed);
  CHECK_EQUAL(left.GetNumPart(), 600);

  HaloAccumulator_t empty;
  empty.Reset(3);
  HaloAccumulator_t with_empty=x;
  with_empty.Merge(empty);
  CheckSameSums(with_empty, x);
}

static void TestRadialBins()
{
  RadialBins_t bins(10., 0.01);
  CHECK_EQUAL(bins.GetBin(0.), 0);
  CHECK_EQUAL(bins.GetBin(0.05), 0);
  CHECK_EQUAL(bins.GetBin(9.999), NumRadialBins-1);
  CHECK_EQUAL(bins.GetBin(10.), -1);
  CHECK_EQUAL(bins.GetBin(25.), -1);
  CHECK_CLOSE(bins.OuterEdge(0), 0.1, 1e-6);
  CHECK_CLOSE(bins.OuterEdge(NumRadialBins-1), 10., 1e-9);
  for(int k=1;k<NumRadialBins;k++)
  {
	double rmid=sqrt(bins.OuterEdge(k-1)*bins.OuterEdge(k));
	CHECK_EQUAL(bins.GetBin(rmid), k);
  }
}

static void TestSphericalOverdensity()
/*a singular isothermal sphere, M(<r)=A*r, has mean enclosed density 3A/(4 pi r^2); log-log interpolation is exact*/
{
  const double A=1e12, rmax=10.;
  RadialBins_t bins(rmax, 0.01);
  HaloAccumulator_t acc;
  acc.Reset(0);
  acc.Profile[0].MassType[TypeDM].Add(A*bins.OuterEdge(0));
  for(int k=1;k<NumRadialBins;k++)
	acc.Profile[k].MassType[TypeDM].Add(A*(bins.OuterEdge(k)-bins.OuterEdge(k-1)));

  double M, R;
  int nbin;
  double target_radius=2.;
  double threshold=3.*A/(4.*M_PI*target_radius*target_radius);
  CHECK(!SphericalOverdensitySize(acc, bins, threshold, M, R, nbin));
  CHECK_CLOSE(R, target_radius, 1e-9);
  CHECK_CLOSE(M, A*target_radius, 1e-9);
  CHECK(nbin>0&&nbin<NumRadialBins);
  CHECK(bins.OuterEdge(nbin-1)<=R);
  CHECK(bins.OuterEdge(nbin)>R);

  //still above the threshold at the read radius: the outermost edge is a lower bound
  CHECK(SphericalOverdensitySize(acc, bins, threshold*1e-4, M, R, nbin));
  CHECK_CLOSE(R, rmax, 1e-9);
  CHECK_CLOSE(M, A*rmax, 1e-9);
  CHECK_EQUAL(nbin, NumRadialBins);

  //never above the threshold
  CHECK(!SphericalOverdensitySize(acc, bins, threshold*1e6, M, R, nbin));
  CHECK_EQUAL(M, 0.);
  CHECK_EQUAL(R, 0.);
  CHECK_EQUAL(nbin, 0);

  HaloAccumulator_t empty;
  empty.Reset(0);
  CHECK(!SphericalOverdensitySize(empty, bins, threshold, M, R, nbin));
  CHECK_EQUAL(M, 0.);
  CHECK_EQUAL(nbin, 0);
}

static void TestSphereContents()
/* an isothermal sphere, M(<r)=A*r, made of gas, dark matter, stars and black holes in fixed mass fractions.
 * the sums inside R_SO run up to the last bin edge inside R_SO, so each enclosed mass telescopes to A times that edge.
 * in every bin: hot gas on +x moving at vx=100, cold gas on -x, dark matter split between +y and -y,
 * stars on +z and black holes on -z.*/
{
  const double A=1e12, rmax=10., target_radius=2.;
  Parameter_t config;
  config.SetBoxSize(100.);
  HPxyz centre;
  centre.fill(50.);
  RadialBins_t bins(rmax, 0.01);
  HaloAccumulator_t acc;
  acc.Reset(0);

  int nbin_expected=0;
  while(bins.OuterEdge(nbin_expected)<=target_radius)
	nbin_expected++;
  double moment_z=0., mass_expected=0.;
  HPInt index=0;
  for(int k=0;k<NumRadialBins;k++)
  {
	double inner=k?bins.OuterEdge(k-1):0.;
	double r=k?sqrt(inner*bins.OuterEdge(k)):0.5*bins.OuterEdge(0);
	double mbin=A*(bins.OuterEdge(k)-inner);
	vector <Particle_t> particles={
	  MakeParticle(index++, TypeGas, 0.1*mbin, r, 0., 0., 100., 1e6),
	  MakeParticle(index++, TypeGas, 0.1*mbin, -r, 0., 0., 0., 1e4),
	  MakeParticle(index++, TypeDM, 0.35*mbin, 0., r, 0.),
	  MakeParticle(index++, TypeDM, 0.35*mbin, 0., -r, 0.),
	  MakeParticle(index++, TypeStar, 0.08*mbin, 0., 0., r),
	  MakeParticle(index++, TypeBH, 0.02*mbin, 0., 0., -r)
	};
	particles[0].XrayLuminosity=1.;
	particles[0].XrayPhotonLuminosity=2.;
	particles[1].XrayPhotonLuminosity=2.;
	particles[1].ComptonY=1e-6;
	particles[4].InitialMass=1.25*particles[4].Mass;
	particles[5].SubgridMass=0.5*particles[5].Mass;
	for(auto &&p: particles)
	{
	  double dx[3]={p.ComovingPosition[0], p.ComovingPosition[1], p.ComovingPosition[2]};
	  for(int j=0;j<3;j++)
		p.ComovingPosition[j]+=centre[j];
	  acc.AddToSphere(p, dx, r, 1., bins, config.HotGasTemperature);
	}
	if(k<nbin_expected)
	{
	  moment_z+=0.06*mbin*r;
	  mass_expected+=mbin;
	}
  }

  double threshold=3.*A/(4.*M_PI*target_radius*target_radius);
  double edge=bins.OuterEdge(nbin_expected-1);
  SphereProperty_t so;
  CHECK(!so.Compute(acc, bins, threshold, centre, config));
  CHECK_CLOSE(so.Radius, target_radius, 1e-6);
  CHECK_CLOSE(so.Mass, A*target_radius, 1e-6);
  CHECK_CLOSE(mass_expected, A*edge, 1e-6);
  CHECK_CLOSE(so.MassType[TypeGas], 0.2*A*edge, 1e-6);
  CHECK_CLOSE(so.MassType[TypeDM], 0.7*A*edge, 1e-6);
  CHECK_CLOSE(so.MassType[TypeStar], 0.08*A*edge, 1e-6);
  CHECK_CLOSE(so.MassType[TypeBH], 0.02*A*edge, 1e-6);
  CHECK_EQUAL(so.MassType[TypeNeutrino], 0.);
  CHECK_CLOSE(so.CentreOfMass[0], 50., 1e-6);
  CHECK_CLOSE(so.CentreOfMass[1], 50., 1e-6);
  CHECK_CLOSE(so.CentreOfMass[2], 50.+moment_z/mass_expected, 1e-6);
  CHECK_CLOSE(so.CentreOfMassVelocity[0], 10., 1e-6);
  CHECK_CLOSE(so.CentreOfMassVelocity[1], 0., 1e-6);
  CHECK_CLOSE(so.HotGasMass, 0.1*A*edge, 1e-6);
  CHECK_CLOSE(so.HotGasTemperature, 1e6, 1e-6);
  CHECK_CLOSE(so.XrayLuminosity, nbin_expected, 1e-12);
  CHECK_CLOSE(so.XrayPhotonLuminosity, 4.*nbin_expected, 1e-12);
  CHECK_CLOSE(so.ComptonY, 1e-6*nbin_expected, 1e-12);
  CHECK_CLOSE(so.StellarInitialMass, 0.1*A*edge, 1e-6);
  CHECK_CLOSE(so.BHSubgridMass, 0.01*A*edge, 1e-6);

  //a lower bound covers every bin
  CHECK(so.Compute(acc, bins, threshold*1e-4, centre, config));
  CHECK_CLOSE(so.Radius, rmax, 1e-6);
  CHECK_CLOSE(so.MassType[TypeDM], 0.7*A*rmax, 1e-6);
  CHECK_CLOSE(so.StellarInitialMass, 0.1*A*rmax, 1e-6);
  CHECK_CLOSE(so.XrayLuminosity, NumRadialBins, 1e-12);

  //no radius, nothing inside
  CHECK(!so.Compute(acc, bins, threshold*1e6, centre, config));
  CHECK_EQUAL(so.Mass, 0.);
  CHECK_EQUAL(so.MassType[TypeGas], 0.);
  CHECK_EQUAL(so.HotGasTemperature, 0.);
  CHECK_EQUAL(so.XrayLuminosity, 0.);
  for(int j=0;j<3;j++)
  {
	CHECK_EQUAL(so.CentreOfMass[j], centre[j]);
	CHECK_EQUAL(so.CentreOfMassVelocity[j], 0.);
  }
}

static HaloEntry_t MakeHalo(HPInt id, double x, double y, double z, double rsize, const Parameter_t &config)
{
  HaloEntry_t halo;
  halo.HaloId=id;
  halo.HostHaloId=SpecialConst::NullHaloId;
  halo.CentreOfPotential={(HPReal)x, (HPReal)y, (HPReal)z};
  halo.CentreOfMass=halo.CentreOfPotential;
  halo.RadiusSize=rsize;
  SetSearchRadius(halo, config);
  return halo;
}

static void TestFinalize()
{
  Parameter_t config;
  config.SetBoxSize(100.);
  PhysicalConst::G=4.30091727e-9;
  PhysicalConst::H0=100.;
  Cosmology_t cosmology;
  cosmology.Set(1., 0.3, 0.7, 0.7);
  CHECK_CLOSE(cosmology.CriticalDensity, 2.77536627e11*0.49, 1e-5);
  CHECK_CLOSE(cosmology.MeanDensity, 0.3*cosmology.CriticalDensity, 1e-12);

  {//empty halo gives the sentinel record
	HaloEntry_t halo=MakeHalo(42, 10., 20., 30., 1., config);
	HaloAccumulator_t acc;
	acc.Reset(0);
	HaloProperty_t prop;
	CHECK_EQUAL(prop.Finalize(halo, acc, cosmology, config), 0);
	CHECK_EQUAL(prop.HaloId, 42);
	CHECK_EQUAL(prop.NumPart, 0);
	CHECK_EQUAL(prop.Mass, 0.);
	CHECK_EQUAL(prop.MassInRadius, 0.);
	for(int j=0;j<3;j++)
	{
	  CHECK_EQUAL(prop.CentreOfMass[j], prop.CentreOfPotential[j]);
	  CHECK_EQUAL(prop.CentreOfMassVelocity[j], 0.);
	}
	CHECK_EQUAL(prop.HotGasTemperature, 0.);
	CHECK_EQUAL(prop.SO200Crit.Mass, 0.);
	CHECK_EQUAL(prop.SO200Mean.Radius, 0.);
	CHECK_EQUAL(prop.SO500Crit.HotGasMass, 0.);
	CHECK_EQUAL(prop.SO200Crit.CentreOfMass[1], prop.CentreOfPotential[1]);
  }

  {//members straddling the periodic boundary
	HaloEntry_t halo=MakeHalo(7, 99.5, 50., 50., 2., config);
	CHECK_CLOSE(halo.SearchRadius, 2.02, 1e-6);
	HaloAccumulator_t acc;
	acc.Reset(0);
	vector <Particle_t> particles={
	  MakeParticle(0, TypeDM, 1., 0.5, 50., 50., 10.),
	  MakeParticle(1, TypeDM, 3., 98.5, 50., 50., -2.),
	  MakeParticle(2, TypeGas, 2., 99.5, 50., 50., 0., 2e5),
	  MakeParticle(3, TypeGas, 1., 99.5, 50.5, 50., 0., 1e4)
	};
	RadialBins_t bins(halo.ReadRadius, config.ProfileInnerFraction);
	for(auto &&p: particles)
	{
	  double dx[3];
	  PeriodicOffset(p.ComovingPosition, halo.CentreOfPotential, dx, config);
	  acc.AddMember(p, dx, config.HotGasTemperature);
	  acc.AddToSphere(p, dx, sqrt(dx[0]*dx[0]+dx[1]*dx[1]+dx[2]*dx[2]), halo.RadiusSize, bins, config.HotGasTemperature);
	}
	HaloProperty_t prop;
	prop.Finalize(halo, acc, cosmology, config);
	CHECK_EQUAL(prop.NumPart, 4);
	CHECK_EQUAL(prop.NumPartType[TypeDM], 2);
	CHECK_EQUAL(prop.NumPartType[TypeGas], 2);
	CHECK_CLOSE(prop.Mass, 7., 1e-12);
	CHECK_CLOSE(prop.MassType[TypeGas], 3., 1e-12);
	CHECK_CLOSE(prop.CentreOfMass[0], 99.5-2./7., 1e-5);
	CHECK_CLOSE(prop.CentreOfMass[1], 50.+0.5/7., 1e-5);
	CHECK_CLOSE(prop.CentreOfMassVelocity[0], 4./7., 1e-6);
	CHECK_CLOSE(prop.HotGasMass, 2., 1e-12);
	CHECK_CLOSE(prop.HotGasTemperature, 2e5, 1e-6);
	CHECK_EQUAL(prop.NumPartInRadius, 4);
	CHECK_CLOSE(prop.MassInRadius, 7., 1e-12);
  }
}

int main(int argc, char **argv)
{
  HPLog.SetThreshold(LogLevel_t::Warning);
  TestCompensatedSum();
  TestMergeOrder();
  TestRadialBins();
  TestSphericalOverdensity();
  TestSphereContents();
  TestFinalize();
  return TestReport("test_halo_property");
}
