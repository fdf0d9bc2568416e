// Alpha refinement and spill suppression

#include <QtTest>

#include <chroma_composite_engine/cce_mask_refiner.h>
#include <opencv2/imgproc.hpp>

class TestMaskRefiner : public QObject
{
    Q_OBJECT

private:
    static cce::MaskRefinerConfig config(int blur, bool cleanup, double spill = 0.0) {
        cce::MaskRefinerConfig c;
        c.edge_blur = blur;
        c.cleanup = cleanup;
        c.spill_strength = spill;
        c.key = cce::KeyColorSpec::Green();
        return c;
    }

private slots:
    void test_alpha_is_inverse_of_backdrop() {
        cce::MaskRefiner refiner(config(0, false));
        cv::Mat backdrop(10, 20, CV_8UC1, cv::Scalar(0));
        backdrop(cv::Rect(0, 0, 10, 10)).setTo(255);

        cv::Mat alpha;
        refiner.refine(backdrop, alpha);
        QCOMPARE(alpha.type(), CV_8UC1);
        QCOMPARE(alpha.at<uint8_t>(5, 5), uint8_t(0));
        QCOMPARE(alpha.at<uint8_t>(5, 15), uint8_t(255));
        QCOMPARE(cv::countNonZero(alpha), 100);
    }

    void test_uniform_masks_survive_blur() {
        cce::MaskRefiner refiner(config(5, true));
        cv::Mat alpha;

        refiner.refine(cv::Mat(16, 16, CV_8UC1, cv::Scalar(255)), alpha);
        QCOMPARE(cv::countNonZero(alpha), 0);

        refiner.refine(cv::Mat(16, 16, CV_8UC1, cv::Scalar(0)), alpha);
        QCOMPARE(cv::countNonZero(alpha == 255), 16 * 16);
    }

    void test_blur_softens_edges() {
        cce::MaskRefiner refiner(config(5, false));
        cv::Mat backdrop(20, 20, CV_8UC1, cv::Scalar(0));
        backdrop(cv::Rect(0, 0, 10, 20)).setTo(255);

        cv::Mat alpha;
        refiner.refine(backdrop, alpha);
        // Far from the edge values are untouched
        QCOMPARE(alpha.at<uint8_t>(10, 1), uint8_t(0));
        QCOMPARE(alpha.at<uint8_t>(10, 18), uint8_t(255));
        // Next to the edge they are partial
        QVERIFY(alpha.at<uint8_t>(10, 9) > 0);
        QVERIFY(alpha.at<uint8_t>(10, 10) < 255);
    }

    void test_no_blur_keeps_hard_edge() {
        cce::MaskRefiner refiner(config(1, false));
        cv::Mat backdrop(20, 20, CV_8UC1, cv::Scalar(0));
        backdrop(cv::Rect(0, 0, 10, 20)).setTo(255);

        cv::Mat alpha;
        refiner.refine(backdrop, alpha);
        QCOMPARE(alpha.at<uint8_t>(10, 9), uint8_t(0));
        QCOMPARE(alpha.at<uint8_t>(10, 10), uint8_t(255));
    }

    void test_cleanup_removes_specks_and_pinholes() {
        cce::MaskRefiner refiner(config(0, true));
        cv::Mat backdrop(20, 20, CV_8UC1, cv::Scalar(0));
        backdrop(cv::Rect(0, 0, 10, 20)).setTo(255);
        // Pinhole of subject inside the backdrop
        backdrop.at<uint8_t>(10, 4) = 0;
        // Speck of backdrop inside the subject
        backdrop.at<uint8_t>(10, 15) = 255;

        cv::Mat alpha;
        refiner.refine(backdrop, alpha);
        QCOMPARE(alpha.at<uint8_t>(10, 4), uint8_t(0));
        QCOMPARE(alpha.at<uint8_t>(10, 15), uint8_t(255));

        cce::MaskRefiner raw(config(0, false));
        raw.refine(backdrop, alpha);
        QCOMPARE(alpha.at<uint8_t>(10, 4), uint8_t(255));
        QCOMPARE(alpha.at<uint8_t>(10, 15), uint8_t(0));
    }

    void test_key_channel() {
        QCOMPARE(cce::MaskRefiner::key_channel(cce::KeyColorSpec::Green()), 1);
        QCOMPARE(cce::MaskRefiner::key_channel(cce::KeyColorSpec::Blue()), 0);
        auto red = cce::KeyColorSpec::Custom({170, 80, 80}, {10, 255, 255});
        QCOMPARE(cce::MaskRefiner::key_channel(red), 2);
    }

    void test_spill_disabled_is_noop() {
        cce::MaskRefiner refiner(config(0, false, 0.0));
        QVERIFY(!refiner.spill_enabled());

        cv::Mat fg(10, 10, CV_8UC3, cv::Scalar(50, 200, 60));
        cv::Mat before = fg.clone();
        cv::Mat alpha(10, 10, CV_8UC1, cv::Scalar(128));
        refiner.suppress_spill(fg, alpha);
        QCOMPARE(cv::norm(fg, before, cv::NORM_INF), 0.0);
    }

    void test_spill_touches_edges_only() {
        cce::MaskRefiner refiner(config(0, false, 1.0));
        QVERIFY(refiner.spill_enabled());

        cv::Mat fg(10, 10, CV_8UC3, cv::Scalar(50, 200, 60));
        cv::Mat alpha(10, 10, CV_8UC1, cv::Scalar(0));
        alpha(cv::Rect(2, 2, 6, 6)).setTo(255);
        alpha(cv::Rect(2, 1, 6, 1)).setTo(128);

        refiner.suppress_spill(fg, alpha);

        // Interior of the opaque subject keeps its color
        QVERIFY(fg.at<cv::Vec3b>(5, 5) == cv::Vec3b(50, 200, 60));
        // Transparent pixels are never shown, so left alone
        QVERIFY(fg.at<cv::Vec3b>(0, 0) == cv::Vec3b(50, 200, 60));
        // Semi-transparent edge: green pulled down to the strongest other channel
        QVERIFY(fg.at<cv::Vec3b>(1, 5) == cv::Vec3b(50, 60, 60));
        // Opaque pixel on the subject border counts as edge
        QVERIFY(fg.at<cv::Vec3b>(2, 5) == cv::Vec3b(50, 60, 60));
    }

    void test_spill_strength_scales_reduction() {
        cce::MaskRefiner refiner(config(0, false, 0.5));
        cv::Mat fg(4, 4, CV_8UC3, cv::Scalar(50, 200, 60));
        cv::Mat alpha(4, 4, CV_8UC1, cv::Scalar(128));

        refiner.suppress_spill(fg, alpha);
        // excess 140, half removed
        QVERIFY(fg.at<cv::Vec3b>(1, 1) == cv::Vec3b(50, 130, 60));
    }

    void test_spill_ignores_pixels_without_excess() {
        cce::MaskRefiner refiner(config(0, false, 1.0));
        cv::Mat fg(4, 4, CV_8UC3, cv::Scalar(200, 100, 150));
        cv::Mat alpha(4, 4, CV_8UC1, cv::Scalar(128));

        refiner.suppress_spill(fg, alpha);
        QVERIFY(fg.at<cv::Vec3b>(1, 1) == cv::Vec3b(200, 100, 150));
    }

    void test_umat_refine_matches_mat() {
        cce::MaskRefiner refiner(config(5, true));
        cv::Mat backdrop(24, 24, CV_8UC1, cv::Scalar(0));
        cv::circle(backdrop, cv::Point(12, 12), 6, cv::Scalar(255), cv::FILLED);

        cv::Mat cpu_alpha;
        refiner.refine(backdrop, cpu_alpha);

        cv::UMat u_alpha;
        refiner.refine(backdrop.getUMat(cv::ACCESS_READ), u_alpha);
        cv::Mat gpu_alpha = u_alpha.getMat(cv::ACCESS_READ).clone();

        // OpenCL kernels may round differently by one step
        QVERIFY(cv::norm(cpu_alpha, gpu_alpha, cv::NORM_INF) <= 1.0);
    }
};

QTEST_MAIN(TestMaskRefiner)
#include "test_mask_refiner.moc"
