#include <gtest/gtest.h>

#include "compiler/DispenseCompiler.h"
#include "TestData.h"

namespace {

QStringList compileOrFail(const DispenseCompiler &compiler,
                          const ActiveCalibrationData &cal,
                          const Protocol &protocol,
                          const PlateType &plate)
{
    QStringList commands;
    DispenseError err;
    EXPECT_TRUE(compiler.compile(cal, protocol, plate, &commands, &err)) << err.toString().toStdString();
    return commands;
}

} // namespace

TEST(DispenseCompiler, FullPlateSingleValve)
{
    const DispenseCompiler compiler;
    const QStringList commands = compileOrFail(compiler, testdata::calibration(),
                                               testdata::fullPlate(10.0), testdata::plate96());

    ASSERT_EQ(commands.size(), 9);
    EXPECT_EQ(commands.first(), "CLR_VALVE_WELL,1,0");
    for (int i = 1; i < commands.size(); ++i) {
        const QStringList f = commands.at(i).split(',');
        ASSERT_EQ(f.size(), 6 + 12 * 5) << commands.at(i).toStdString();
        EXPECT_EQ(f.at(0), "VALVE_WELL");
        EXPECT_EQ(f.at(3), "1");    // valve
        EXPECT_EQ(f.at(4), "750");  // well delta
        EXPECT_EQ(f.at(5), "12");
        EXPECT_EQ(f.at(9), "10000");
    }

    // Serpentine over every row: A forward, B reversed, C forward ...
    for (int row = 0; row < 8; ++row) {
        const QStringList f = commands.at(1 + row).split(',');
        const QString expected = row % 2 == 0 ? "-1" : "1";
        for (int well = 0; well < 12; ++well)
            EXPECT_EQ(f.at(6 + well * 5 + 2), expected) << "row " << row << " well " << well;
        const int yUm = 11240 + row * 9000;
        EXPECT_EQ(f.at(7), QString::number(yUm));
        EXPECT_EQ(f.at(6), row % 2 == 0 ? "14380" : "113380");
    }

    EXPECT_TRUE(commands.at(1).startsWith("VALVE_WELL,1,0,1,750,12,14380,11240,-1,10000,1,23380,11240,-1,"));
    EXPECT_TRUE(commands.at(2).startsWith("VALVE_WELL,1,0,1,750,12,113380,20240,1,10000,1,104380,20240,1,"));
}

TEST(DispenseCompiler, IsDeterministic)
{
    const DispenseCompiler compiler;
    const Protocol protocol = testdata::fullPlate(5.0, 12.0);
    const QStringList a = compileOrFail(compiler, testdata::calibration(), protocol, testdata::plate96());
    const QStringList b = compileOrFail(compiler, testdata::calibration(), protocol, testdata::plate96());
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), 1 + 8 + 8);
}

TEST(DispenseCompiler, EmptyLinesDoNotFlipDirection)
{
    const DispenseCompiler compiler;
    const Protocol protocol = Protocol::fromList({{"A1", 5.0, 0.0}, {"C4", 5.0, 0.0}, {"D2", 5.0, 0.0}});
    const QStringList commands = compileOrFail(compiler, testdata::calibration(), protocol,
                                               testdata::plate96());
    ASSERT_EQ(commands.size(), 4);

    auto approach = [](const QString &cmd) { return cmd.split(',').at(8); };
    EXPECT_EQ(approach(commands.at(1)), "-1");  // row A
    EXPECT_EQ(approach(commands.at(2)), "1");   // row C, B skipped
    EXPECT_EQ(approach(commands.at(3)), "-1");  // row D

    // Row C reversed: first well is C12 with zero open time, C4 is ninth
    const QStringList c = commands.at(2).split(',');
    EXPECT_EQ(c.at(9), "0");
    EXPECT_EQ(c.at(6 + 8 * 5 + 3), "5000");
}

TEST(DispenseCompiler, ValveTwoFollowsValveOne)
{
    const DispenseCompiler compiler(3);
    const Protocol protocol = Protocol::fromList({{"A1", 5.0, 0.0}, {"B1", 0.0, 5.0}});
    const QStringList commands = compileOrFail(compiler, testdata::calibration(), protocol,
                                               testdata::plate96());
    ASSERT_EQ(commands.size(), 3);
    EXPECT_EQ(commands.at(0), "CLR_VALVE_WELL,3,0");
    EXPECT_TRUE(commands.at(1).startsWith("VALVE_WELL,3,0,1,"));
    EXPECT_TRUE(commands.at(2).startsWith("VALVE_WELL,3,0,2,"));
    // Each valve starts its own serpentine going forward
    EXPECT_EQ(commands.at(2).split(',').at(8), "-1");
}

TEST(DispenseCompiler, EmptyProtocolOnlyClears)
{
    const DispenseCompiler compiler;
    const QStringList commands = compileOrFail(compiler, ActiveCalibrationData(),
                                               Protocol::fromList({}), testdata::plate96());
    EXPECT_EQ(commands, QStringList{"CLR_VALVE_WELL,1,0"});
}

TEST(DispenseCompiler, VolumesBelowCalibratedRangeProduceNoLines)
{
    const DispenseCompiler compiler;
    const QStringList commands = compileOrFail(compiler, testdata::calibration(),
                                               testdata::fullPlate(0.5), testdata::plate96());
    EXPECT_EQ(commands.size(), 1);
}

TEST(DispenseCompiler, MinimumVolumeSuppressesSmallDispenses)
{
    const DispenseCompiler compiler(1, 6.0);
    const Protocol protocol = Protocol::fromList({{"A1", 5.0, 0.0}, {"B1", 7.0, 0.0}});
    const QStringList commands = compileOrFail(compiler, testdata::calibration(), protocol,
                                               testdata::plate96());
    ASSERT_EQ(commands.size(), 2);
    EXPECT_TRUE(commands.at(1).contains(",20240,-1,7000,1"));
}

TEST(DispenseCompiler, MissingCalibrationForUsedValve)
{
    const DispenseCompiler compiler;
    DispenseError err;
    QStringList commands;
    EXPECT_FALSE(compiler.compile(testdata::calibration({1}), testdata::fullPlate(0.0, 5.0),
                                  testdata::plate96(), &commands, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Configuration);
    EXPECT_TRUE(commands.isEmpty());
}

TEST(DispenseCompiler, UnusedValveNeedsNoCalibration)
{
    const DispenseCompiler compiler;
    const QStringList commands = compileOrFail(compiler, testdata::calibration({1}),
                                               testdata::fullPlate(10.0), testdata::plate96());
    EXPECT_EQ(commands.size(), 9);
}

TEST(DispenseCompiler, UnusableOpenTimeFailsCompile)
{
    const DispenseCompiler compiler;
    DispenseError err;
    QStringList commands;
    const ActiveCalibrationData cal = testdata::calibration({1}, testdata::nearlyFlatTopTable());
    EXPECT_FALSE(compiler.compile(cal, Protocol::fromList({{"A1", 10.00005, 0.0}, {"B3", 50.0, 0.0}}),
                                  testdata::plate96(), &commands, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Configuration);
    EXPECT_TRUE(err.message.contains("B3")) << err.message.toStdString();
    EXPECT_TRUE(commands.isEmpty());
}

TEST(DispenseCompiler, DurationBelowMinimumSkipsCalibration)
{
    const DispenseCompiler compiler(1, 60.0);
    int usecs = -1;
    DispenseError err;
    EXPECT_TRUE(compiler.dispenseDurationUsecs(testdata::nearlyFlatTopTable(), 50.0, &usecs, &err));
    EXPECT_EQ(usecs, 0);
}

TEST(DispenseCompiler, LookupIgnoresWellNameSpelling)
{
    Protocol protocol;
    protocol.wells << ProtocolWell{"a01", {{1, 5.0}}} << ProtocolWell{" b2 ", {{1, 10.0}}};
    const QStringList commands = compileOrFail(DispenseCompiler(), testdata::calibration({1}),
                                               protocol, testdata::plate96());
    ASSERT_EQ(commands.size(), 3);
    EXPECT_EQ(commands.at(1).split(',').at(9), "5000");
    // Row B is reversed, B2 is the eleventh well
    EXPECT_EQ(commands.at(2).split(',').at(6 + 10 * 5 + 3), "10000");
}

TEST(DispenseCompiler, InvalidPlateIsConfigurationError)
{
    PlateType plate = testdata::plate96();
    plate.wellCount = 0;
    DispenseError err;
    EXPECT_FALSE(DispenseCompiler().compile(testdata::calibration(), testdata::fullPlate(1.0),
                                            plate, nullptr, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Configuration);
}

TEST(DispenseCompiler, HighDensityPlateUsesShortDelta)
{
    PlateType plate = testdata::plate96();
    plate.wellCount = 1536;
    plate.wellPitchMm = 2.25;
    const QStringList commands = compileOrFail(DispenseCompiler(), testdata::calibration(),
                                               Protocol::fromList({{"AF48", 2.0, 0.0}}), plate);
    ASSERT_EQ(commands.size(), 2);
    const QStringList f = commands.at(1).split(',');
    EXPECT_EQ(f.at(4), "250");
    EXPECT_EQ(f.at(5), "48");
}

TEST(DispenseCompiler, ValveCommand)
{
    EXPECT_EQ(DispenseCompiler(1).valveCommand(2, 1500, 1, 0), "VALVE,1,0,2,1500,1,0");
}
