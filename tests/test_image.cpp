#include <gtest/gtest.h>
#include <doc_chunker/image.h>

using namespace doc_chunker;

class ImageTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_ = MupdfContext::create();
    }

    std::shared_ptr<MupdfContext> context_;
};

TEST_F(ImageTest, DefaultIsEmpty) {
    Image image;
    EXPECT_TRUE(image.empty());
    EXPECT_FALSE(image);
    EXPECT_EQ(image.width(), 0);
    EXPECT_TRUE(image.rgb().empty());
}

TEST_F(ImageTest, CreateFillsCanvas) {
    Image image = Image::create(context_, 4, 2, 255);

    ASSERT_TRUE(image);
    EXPECT_EQ(image.width(), 4);
    EXPECT_EQ(image.height(), 2);
    auto rgb = image.rgb();
    ASSERT_EQ(rgb.size(), 24u);
    EXPECT_EQ(rgb.front(), 255);
    EXPECT_EQ(rgb.back(), 255);
}

TEST_F(ImageTest, InvalidArguments) {
    EXPECT_THROW(Image::create(context_, 0, 2), std::invalid_argument);
    EXPECT_THROW(Image::create(nullptr, 2, 2), std::invalid_argument);
    EXPECT_THROW(Image::from_rgb(context_, 2, 2, std::vector<unsigned char>(5)),
                 std::invalid_argument);
}

TEST_F(ImageTest, FromRgbKeepsPixels) {
    std::vector<unsigned char> rgb = {1, 2, 3, 4, 5, 6};
    Image image = Image::from_rgb(context_, 2, 1, rgb);

    EXPECT_EQ(image.rgb(), rgb);
}

TEST_F(ImageTest, ConcatWithAbsentImage) {
    Image image = Image::create(context_, 3, 3);

    EXPECT_TRUE(concat_img(image, Image()).same_as(image));
    EXPECT_TRUE(concat_img(Image(), image).same_as(image));
    EXPECT_FALSE(concat_img(Image(), Image()));
}

TEST_F(ImageTest, ConcatSameImageIsIdempotent) {
    Image image = Image::create(context_, 3, 3, 128);

    Image merged = concat_img(image, image);
    EXPECT_TRUE(merged.same_as(image));

    Image twin = Image::create(context_, 3, 3, 128);
    Image merged_twin = concat_img(image, twin);
    EXPECT_TRUE(merged_twin.same_as(image));
    EXPECT_EQ(merged_twin.height(), 3);
}

TEST_F(ImageTest, ConcatStacksVertically) {
    Image top = Image::from_rgb(context_, 2, 1, {10, 10, 10, 20, 20, 20});
    Image bottom = Image::from_rgb(context_, 1, 1, {30, 30, 30});

    Image merged = concat_img(top, bottom);

    ASSERT_EQ(merged.width(), 2);
    ASSERT_EQ(merged.height(), 2);
    EXPECT_EQ(merged.rgb(),
              (std::vector<unsigned char>{10, 10, 10, 20, 20, 20, 30, 30, 30, 0, 0, 0}));
}

TEST_F(ImageTest, CopiesShareThePixmap) {
    Image image = Image::create(context_, 2, 2);
    Image copy = image;

    EXPECT_TRUE(copy.same_as(image));
    EXPECT_TRUE(copy.pixels_equal(image));
    EXPECT_FALSE(copy.same_as(Image::create(context_, 2, 2)));
}
