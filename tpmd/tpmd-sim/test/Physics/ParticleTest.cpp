// Ticket: 0001_two_particle_core
// Test: Particle unit tests

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

#include "tpmd-sim/src/Physics/Particle.hpp"

namespace tpmd_sim
{
namespace test
{

constexpr double kArgonMass = 39.948;

// ========== Construction ==========

TEST(Particle, Construction_CopiesStateAndZeroesForce)
{
  Coordinate const position{1.0, 2.0};
  Velocity const velocity{0.1, 0.2};

  Particle const particle{position, velocity, kArgonMass};

  EXPECT_EQ(particle.position, position);
  EXPECT_EQ(particle.velocity, velocity);
  EXPECT_DOUBLE_EQ(particle.getMass(), kArgonMass);
  EXPECT_FALSE(particle.isFixed());
  EXPECT_EQ(particle.force, ForceVector(0.0, 0.0));
}

TEST(Particle, Construction_DefaultMassIsOne)
{
  Particle const particle{Coordinate{0.0, 0.0}, Velocity{0.0, 0.0}};

  EXPECT_DOUBLE_EQ(particle.getMass(), 1.0);
  EXPECT_FALSE(particle.isFixed());
}

TEST(Particle, Construction_FixedFlagStored)
{
  Particle const particle{
    Coordinate{1.0, 2.0}, Velocity{0.1, 0.2}, kArgonMass, true};

  EXPECT_TRUE(particle.isFixed());
}

TEST(Particle, Construction_ZeroMass_Throws)
{
  EXPECT_THROW(
    (Particle{Coordinate{0.0, 0.0}, Velocity{0.0, 0.0}, 0.0}),
    std::invalid_argument);
}

TEST(Particle, Construction_NegativeMass_Throws)
{
  EXPECT_THROW(
    (Particle{Coordinate{0.0, 0.0}, Velocity{0.0, 0.0}, -1.0}),
    std::invalid_argument);
}

TEST(Particle, Construction_NaNMass_Throws)
{
  EXPECT_THROW((Particle{Coordinate{0.0, 0.0},
                         Velocity{0.0, 0.0},
                         std::numeric_limits<double>::quiet_NaN()}),
               std::invalid_argument);
}

TEST(Particle, Construction_NonFinitePosition_Throws)
{
  EXPECT_THROW((Particle{Coordinate{std::numeric_limits<double>::infinity(), 0.0},
                         Velocity{0.0, 0.0}}),
               std::invalid_argument);
}

TEST(Particle, Construction_NonFiniteVelocity_Throws)
{
  EXPECT_THROW((Particle{Coordinate{0.0, 0.0},
                         Velocity{std::numeric_limits<double>::quiet_NaN(),
                                  0.0}}),
               std::invalid_argument);
  EXPECT_THROW((Particle{Coordinate{0.0, 0.0},
                         Velocity{0.0,
                                  -std::numeric_limits<double>::infinity()}}),
               std::invalid_argument);
}

// ========== Kinetic Energy ==========

TEST(Particle, KineticEnergy_MovingParticle_HalfMassVelocitySquared)
{
  // v^2 = 0.01 + 0.04 = 0.05
  // KE = 0.5 * 39.948 * 0.05 = 0.9987
  Particle const particle{Coordinate{1.0, 2.0}, Velocity{0.1, 0.2}, kArgonMass};

  EXPECT_NEAR(particle.kineticEnergy(), 0.9987, 1e-12);
}

TEST(Particle, KineticEnergy_StationaryParticle_IsZero)
{
  Particle const particle{Coordinate{1.0, 2.0}, Velocity{0.0, 0.0}, kArgonMass};

  EXPECT_EQ(particle.kineticEnergy(), 0.0);
}

TEST(Particle, KineticEnergy_FixedParticle_IsZeroDespiteVelocity)
{
  Particle const particle{
    Coordinate{1.0, 2.0}, Velocity{0.1, 0.2}, kArgonMass, true};

  EXPECT_EQ(particle.kineticEnergy(), 0.0);
}

// ========== Mutable State ==========

TEST(Particle, PositionAndVelocity_AreMutable)
{
  Particle particle{Coordinate{1.0, 2.0}, Velocity{0.1, 0.2}, kArgonMass};

  particle.position = Coordinate{5.0, 6.0};
  particle.velocity = Velocity{-0.3, 0.4};

  EXPECT_EQ(particle.position, Coordinate(5.0, 6.0));
  EXPECT_EQ(particle.velocity, Velocity(-0.3, 0.4));
  EXPECT_NEAR(particle.kineticEnergy(), 0.5 * kArgonMass * 0.25, 1e-12);
}

// ========== Formatting ==========

TEST(Particle, Format_FixedParticleIsTagged)
{
  Particle const moving{Coordinate{1.0, 2.0}, Velocity{0.5, 0.0}, 2.0};
  Particle const pinned{Coordinate{1.0, 2.0}, Velocity{0.0, 0.0}, 2.0, true};

  EXPECT_EQ(fmt::format("{}", moving),
            "Particle(pos=(1.000000, 2.000000), vel=(0.500000, 0.000000), "
            "mass=2)");
  EXPECT_EQ(fmt::format("{}", pinned),
            "Particle(pos=(1.000000, 2.000000), vel=(0.000000, 0.000000), "
            "mass=2) [FIXED]");
}

}  // namespace test
}  // namespace tpmd_sim
