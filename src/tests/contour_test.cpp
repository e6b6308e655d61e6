#include "utils/contour_utils.hpp"
#include "test_common.hpp"

#include <opencv2/opencv.hpp>
#include <stdexcept>

using namespace depth_contour::utils;

namespace {

void testSingleRectangle() {
    test::section("single rectangle");

    const cv::Rect rect(60, 40, 120, 80);
    cv::Mat intensity = cv::Mat::zeros(240, 320, CV_8UC1);
    intensity(rect).setTo(200);

    ContourSegmenter segmenter(125);
    SegmentationResult result = segmenter.segment(intensity);

    test::expect(cv::countNonZero(result.mask) == rect.area(), "mask covers exactly the rectangle");
    test::expect(result.contours.size() == 1, "exactly one contour");

    if (result.contours.size() == 1) {
        cv::Rect box = cv::boundingRect(result.contours[0]);
        std::cout << "  bounding box: " << box << "\n";
        test::expect(box == rect, "bounding box matches the rectangle");
        test::expect(result.contours[0].size() == 4, "simple chain approximation keeps 4 corners");
    }
}

void testThresholdBoundary() {
    test::section("threshold boundary");

    cv::Mat intensity = (cv::Mat_<uchar>(1, 4) << 0, 124, 125, 255);
    ContourSegmenter segmenter(125);
    cv::Mat mask = segmenter.threshold(intensity);

    test::expect(mask.at<uchar>(0, 0) == 0, "0 -> 0");
    test::expect(mask.at<uchar>(0, 1) == 0, "124 (below) -> 0");
    test::expect(mask.at<uchar>(0, 2) == 255, "125 (at level) -> 255");
    test::expect(mask.at<uchar>(0, 3) == 255, "255 -> 255");
}

void testNestedRegions() {
    test::section("nested regions");

    // A ring: the hole gives an inner contour under RETR_TREE
    cv::Mat intensity = cv::Mat::zeros(200, 200, CV_8UC1);
    cv::rectangle(intensity, cv::Rect(20, 20, 160, 160), cv::Scalar(220), cv::FILLED);
    cv::rectangle(intensity, cv::Rect(70, 70, 60, 60), cv::Scalar(10), cv::FILLED);

    ContourSegmenter segmenter;
    SegmentationResult result = segmenter.segment(intensity);
    test::expect(result.contours.size() == 2, "outer and inner boundary of a ring");

    cv::Mat empty = cv::Mat::zeros(50, 50, CV_8UC1);
    test::expect(segmenter.segment(empty).contours.empty(), "empty mask has no contours");
}

void testDrawing() {
    test::section("drawing");

    const cv::Rect rect(60, 40, 120, 80);
    cv::Mat intensity = cv::Mat::zeros(240, 320, CV_8UC1);
    intensity(rect).setTo(200);

    ContourSegmenter segmenter;
    SegmentationResult result = segmenter.segment(intensity);

    cv::Mat frame(240, 320, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat annotated = drawContours(frame, result.contours);

    test::expect(cv::countNonZero(frame.reshape(1)) == 0, "input frame is left untouched");
    test::expect(annotated.at<cv::Vec3b>(rect.y, rect.x + 10) == cv::Vec3b(0, 255, 0),
                 "contour drawn in green");
    test::expect(annotated.at<cv::Vec3b>(rect.y + 1, rect.x + 10) == cv::Vec3b(0, 255, 0),
                 "line is thicker than one pixel");
    test::expect(annotated.at<cv::Vec3b>(rect.y + 40, rect.x + 60) == cv::Vec3b(0, 0, 0),
                 "interior is not filled");
}

void testInvalidInput() {
    test::section("invalid input");

    bool threw = false;
    try {
        ContourSegmenter segmenter(300);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    test::expect(threw, "threshold level above 255 is rejected");

    threw = false;
    try {
        ContourSegmenter segmenter;
        segmenter.threshold(cv::Mat(10, 10, CV_32FC1, cv::Scalar(0.5f)));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    test::expect(threw, "non 8-bit intensity image is rejected");
}

}  // namespace

int main() {
    std::cout << "\n========================================\n";
    std::cout << "  Contour Segmentation Test\n";
    std::cout << "========================================\n";

    testSingleRectangle();
    testThresholdBoundary();
    testNestedRegions();
    testDrawing();
    testInvalidInput();

    return test::finish("Contour Segmentation Test");
}
