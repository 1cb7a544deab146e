#include <gtest/gtest.h>

#include "response/response_curves.hpp"
#include "common/errors.hpp"

#include <Eigen/Dense>

#include <cmath>

using namespace response;

TEST(FrequencyRatiosTest, GridSize) {
    Eigen::VectorXd r = frequency_ratios(0.0, 2.0);
    ASSERT_EQ(r.size(), 200);
    EXPECT_DOUBLE_EQ(r(0), 0.0);
    EXPECT_DOUBLE_EQ(r(199), 2.0);

    EXPECT_THROW(frequency_ratios(2.0, 1.0), common::InvalidParameterError);
    EXPECT_THROW(frequency_ratios(-1.0, 1.0), common::InvalidParameterError);
    EXPECT_THROW(frequency_ratios(1.0, 1.005), common::InvalidParameterError);
}

TEST(SteadyStateResponseTest, ReferenceValue) {
    auto response = steady_state_response({0.1, 0.3, 0.8}, 0.0, 2.0);

    ASSERT_EQ(response.values.rows(), 3);
    ASSERT_EQ(response.values.cols(), 200);
    EXPECT_NEAR(response.values(2, 10).real(), 0.9842315984203909, 1e-12);
    EXPECT_NEAR(response.values(2, 10).imag(), -0.1598833401887975, 1e-12);
    EXPECT_NEAR(std::abs(response.values(0, 0)), 1.0, 1e-15);
}

TEST(SteadyStateResponseTest, UndampedResonanceOnGrid) {
    // linspace(0, 1, 100) contains r = 1 exactly
    EXPECT_THROW(steady_state_response({0.0}, 0.0, 1.0), common::ResonanceError);
    EXPECT_NO_THROW(steady_state_response({0.01}, 0.0, 1.0));
}

TEST(SteadyStateResponseTest, InvalidDampingRatios) {
    EXPECT_THROW(steady_state_response({}, 0.0, 2.0), common::InvalidParameterError);
    EXPECT_THROW(steady_state_response({0.1, -0.2}, 0.0, 2.0), common::InvalidParameterError);
}

TEST(TransmissibilityTest, ReferenceValues) {
    auto result = transmissibility({0.01, 0.05, 0.1, 0.25, 0.5, 0.7}, 0.0, 2.0);

    ASSERT_EQ(result.displacement.rows(), 6);
    EXPECT_NEAR(result.displacement(5, 10), 1.0100027508815634, 1e-12);
    EXPECT_NEAR(result.force(5, 10), 0.01020179036773378, 1e-12);
    EXPECT_DOUBLE_EQ(result.displacement(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(result.force(0, 0), 0.0);
}

TEST(TransmissibilityTest, CrossoverAtRootTwo) {
    auto result = transmissibility({0.1, 0.5}, 1.0, 2.0);

    // D < 1 for every damping ratio once r > sqrt(2)
    for (Eigen::Index col = 0; col < result.r.size(); ++col) {
        if (result.r(col) > std::sqrt(2.0) + 1e-6) {
            EXPECT_LT(result.displacement(0, col), 1.0);
            EXPECT_LT(result.displacement(1, col), 1.0);
        }
    }
}

TEST(RotatingUnbalanceTest, NormalizedAndScaled) {
    UnbalanceParams unbalance;
    auto normalized = rotating_unbalance(unbalance, {0.1, 0.25, 0.707, 1.0}, 0.0, 3.5);
    auto scaled = rotating_unbalance(unbalance, {0.1, 0.25, 0.707, 1.0}, 0.0, 3.5, false);

    ASSERT_EQ(normalized.values.cols(), 350);
    EXPECT_NEAR(normalized.values(1, 10).real(), 0.10104614704226755, 1e-12);
    EXPECT_NEAR(normalized.values(1, 10).imag(), -0.005118260209831551, 1e-12);
    EXPECT_NEAR(scaled.values(1, 10).real(), 0.005052307352113378, 1e-12);
    EXPECT_NEAR(scaled.values(1, 10).imag(), -0.00025591301049157763, 1e-12);
}

TEST(ImpulseResponseTest, ReferenceValue) {
    common::OscillatorParams params(100.0, 20.0, 2000.0);
    auto result = impulse_response(params, 10.0, 100.0);

    ASSERT_EQ(result.t.size(), 25000);
    EXPECT_DOUBLE_EQ(result.x(0), 0.0);
    EXPECT_NEAR(result.x(10), 0.003962984539880561, 1e-14);
}

TEST(ImpulseResponseTest, RequiresUnderdampedOscillator) {
    EXPECT_THROW(impulse_response(common::OscillatorParams(1.0, 3.0, 1.0), 1.0, 10.0), common::InvalidParameterError);
}

TEST(StepResponseTest, ReferenceValue) {
    common::OscillatorParams params(100.0, 20.0, 2000.0);
    auto result = step_response(params, 10.0, 100.0);

    EXPECT_NEAR(result.x(0), 0.0, 1e-15);
    EXPECT_NEAR(result.x(10), 7.958100817300083e-05, 1e-15);
    EXPECT_NEAR(result.x(result.x.size() - 1), 10.0 / 2000.0, 1e-6);
}

TEST(StepResponseTest, AllRegimesStartAtRestAndSettle) {
    for (double c : {20.0, 2.0 * std::sqrt(2000.0 * 100.0), 2000.0}) {
        common::OscillatorParams params(100.0, c, 2000.0);
        auto result = step_response(params, 10.0, 100.0);
        EXPECT_NEAR(result.x(0), 0.0, 1e-15);
        EXPECT_NEAR(result.x(result.x.size() - 1), 0.005, 1e-6);
    }
}

TEST(StepResponseTest, RequiresDamping) {
    EXPECT_THROW(step_response(common::OscillatorParams(1.0, 0.0, 1.0), 1.0, 10.0), common::InvalidParameterError);
}

TEST(ResponseSpectrumTest, ReferenceValue) {
    auto result = response_spectrum(10.0);

    ASSERT_EQ(result.t.size(), 200);
    EXPECT_DOUBLE_EQ(result.t(0), 0.0004);
    EXPECT_DOUBLE_EQ(result.t(199), 1.0);
    EXPECT_NEAR(result.x(10), 1.6285602401720802, 1e-12);
    EXPECT_THROW(response_spectrum(0.0), common::InvalidParameterError);
}

TEST(FourierSeriesTest, ShiftedTriangleWave) {
    // one period of a triangle wave lifted to [0, 2]
    Eigen::VectorXd data(100);
    for (int i = 0; i < 50; ++i) {
        data(i) = 0.04 * i;
        data(50 + i) = 2.0 - 0.04 * i;
    }

    auto series = fourier_series(data, 5);

    ASSERT_EQ(series.a.size(), 5);
    ASSERT_EQ(series.b.size(), 5);
    ASSERT_EQ(series.approximation.size(), 100);
    EXPECT_NEAR(series.a(0), 2.0, 1e-12);
    EXPECT_NEAR(series.a(1), -0.8108361884515067, 1e-12);
    EXPECT_NEAR(series.a(2), 0.0, 1e-12);
    EXPECT_NEAR(series.a(3), -0.09033041542520237, 1e-12);
    EXPECT_NEAR(series.b.cwiseAbs().maxCoeff(), 0.0, 1e-12);
}

TEST(FourierSeriesTest, RecoversSingleHarmonics) {
    const int count = 64;
    Eigen::VectorXd data(count);
    for (int i = 0; i < count; ++i) {
        double phase = 2.0 * M_PI * i / count;
        data(i) = 0.5 + std::cos(3.0 * phase) + 2.0 * std::sin(5.0 * phase);
    }

    auto series = fourier_series(data, 8);

    EXPECT_NEAR(series.a(0), 1.0, 1e-12);
    EXPECT_NEAR(series.a(3), 1.0, 1e-12);
    EXPECT_NEAR(series.b(5), 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(series.b(0), 0.0);
    for (int k : {1, 2, 4, 6, 7}) {
        EXPECT_NEAR(series.a(k), 0.0, 1e-12);
        EXPECT_NEAR(series.b(k), 0.0, 1e-12);
    }
    EXPECT_TRUE(series.approximation.isApprox(data, 1e-12));
}

TEST(FourierSeriesTest, InvalidInput) {
    Eigen::VectorXd data = Eigen::VectorXd::Ones(10);
    EXPECT_THROW(fourier_series(data, 0), common::InvalidParameterError);
    EXPECT_THROW(fourier_series(data, 6), common::InvalidParameterError);
    EXPECT_THROW(fourier_series(Eigen::VectorXd::Ones(1), 1), common::InvalidParameterError);

    data(3) = std::nan("");
    EXPECT_THROW(fourier_series(data, 2), common::InvalidParameterError);
}

TEST(FourierApproximationTest, SquareWave) {
    const int terms = 20;
    Eigen::VectorXd a = Eigen::VectorXd::Zero(terms);
    Eigen::VectorXd b = Eigen::VectorXd::Zero(terms);
    a(0) = -1.0;
    for (int k = 1; k < terms; k += 2) {
        b(k) = 6.0 / (k * M_PI);
    }
    Eigen::VectorXd t(1);
    t << 0.05;

    auto values = fourier_approximation(a, b, 2.0, t);

    EXPECT_NEAR(values(0), 1.2697210294282537, 1e-12);
}

TEST(FourierApproximationTest, TriangleWave) {
    const int terms = 20;
    Eigen::VectorXd a = Eigen::VectorXd::Zero(terms);
    for (int k = 1; k < terms; k += 2) {
        a(k) = -8.0 / (M_PI * M_PI * k * k);
    }
    Eigen::VectorXd t(1);
    t << 0.25;

    auto values = fourier_approximation(a, Eigen::VectorXd::Zero(terms), 10.0, t);

    EXPECT_NEAR(values(0), -0.902349289119351, 1e-12);
    EXPECT_THROW(fourier_approximation(a, Eigen::VectorXd::Zero(3), 10.0, t), common::InvalidParameterError);
    EXPECT_THROW(fourier_approximation(a, a, 0.0, t), common::InvalidParameterError);
}
