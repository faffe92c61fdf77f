#pragma once

#include <QImage>
#include <QSharedPointer>
#include <QSize>

// Renderer side representation of an uploaded pixel buffer. The cache only stores and compares handles.
class Texture
{
public:
    virtual ~Texture() = default;
    virtual QSize size() const = 0;
};

using TextureHandle = QSharedPointer<Texture>;

// Turns decoded RGBA8888 buffers into textures. Called on the thread owning the TextureCache only.
class TextureUploader
{
public:
    virtual ~TextureUploader() = default;
    virtual TextureHandle upload(const QImage& rgba) = 0;
};

// Keeps the pixels in main memory. Used when there is no GPU, e.g. by the slideshow driver and in tests.
class RasterTexture : public Texture
{
public:
    explicit RasterTexture(const QImage& img) : img(img)
    {}

    QSize size() const override
    {
        return this->img.size();
    }

    const QImage& image() const
    {
        return this->img;
    }

private:
    QImage img;
};

class RasterTextureUploader : public TextureUploader
{
public:
    TextureHandle upload(const QImage& rgba) override
    {
        return TextureHandle(new RasterTexture(rgba));
    }
};
