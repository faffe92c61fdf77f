
#include "SmartJpegDecoder.hpp"
#include "Formatter.hpp"

#include <vector>
#include <cstdio>
#include <QDebug>
#include <QColorSpace>
#include <csetjmp>

extern "C"
{
    #include <jerror.h>
    #include <jpeglib.h>
}

struct my_error_mgr
{
    struct jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
};

struct SmartJpegDecoder::Impl
{
    SmartJpegDecoder* q;

    struct jpeg_decompress_struct cinfo = {};
    struct my_error_mgr jerr;
    bool created = false;

    Impl(SmartJpegDecoder* parent) : q(parent)
    {
        // We set up the normal JPEG error routines, then override error_exit.
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = &my_error_exit;
        jerr.pub.output_message = &my_output_message;
    }

    static void my_error_exit(j_common_ptr cinfo) noexcept
    {
        /* cinfo->err really points to a my_error_mgr struct, so coerce pointer */
        auto myerr = reinterpret_cast<struct my_error_mgr*>(cinfo->err);

        (*cinfo->err->output_message) (cinfo);

        /* Return control to the setjmp point */
        longjmp(myerr->setjmp_buffer, 1);
    }

    static void my_output_message(j_common_ptr cinfo)
    {
        char buffer[JMSG_LENGTH_MAX];
        auto self = static_cast<Impl*>(cinfo->client_data);

        (*cinfo->err->format_message) (cinfo, buffer);

        self->q->setDecodingMessage(buffer);
    }

    void destroy()
    {
        if(this->created)
        {
            jpeg_destroy_decompress(&this->cinfo);
            this->created = false;
        }
    }
};

SmartJpegDecoder::SmartJpegDecoder(const QFileInfo& info) : SmartImageDecoder(info), d(std::make_unique<Impl>(this))
{}

SmartJpegDecoder::~SmartJpegDecoder()
{
    d->destroy();
}

void SmartJpegDecoder::decodeHeader(const unsigned char* buffer, qint64 nbytes)
{
    auto& cinfo = d->cinfo;
    d->destroy();
    jpeg_create_decompress(&cinfo);
    d->created = true;

    /* Tell the library to keep any APP2 data it may find */
    jpeg_save_markers(&cinfo, JPEG_APP0 + 2, 0xFFFF);

    cinfo.client_data = d.get();

    jpeg_mem_src(&cinfo, buffer, nbytes);

    this->setDecodingMessage("Reading JPEG Header");

    // section below clobbered by setjmp()/longjmp(); declare all non-trivially destroyable types here
    std::unique_ptr<JOCTET, decltype(&::free)> icc_data(nullptr, free);
    QColorSpace iccProfile{ QColorSpace::SRgb };

    if (setjmp(d->jerr.setjmp_buffer))
    {
        // If we get here, the JPEG code has signaled an error.
        throw std::runtime_error(Formatter() << "Error while decoding the JPEG header: " << this->decodingMessage());
    }

    int ret = jpeg_read_header(&cinfo, true);
    if(ret != JPEG_HEADER_OK)
    {
        throw std::runtime_error(Formatter() << "jpeg_read_header() failed with code " << ret << ", excpeted: " << JPEG_HEADER_OK);
    }

    JOCTET *ptr;
    unsigned int icc_len;
    if(jpeg_read_icc_profile(&cinfo, &ptr, &icc_len))
    {
        icc_data.reset(ptr);
        iccProfile = QColorSpace::fromIccProfile(QByteArray::fromRawData(reinterpret_cast<const char *>(icc_data.get()), icc_len));
    }

    cinfo.out_color_space = JCS_EXT_RGBA;

    this->setSize(QSize(cinfo.image_width, cinfo.image_height));
    this->setColorSpace(iccProfile);
}

std::vector<DecodedFrame> SmartJpegDecoder::decodingLoop(bool)
{
    auto& cinfo = d->cinfo;

    // the entire jpeg() section below is clobbered by setjmp/longjmp
    // hence, declare any objects with nontrivial destructors here
    std::vector<JSAMPLE*> bufferSetup;
    QImage image;

    if (setjmp(d->jerr.setjmp_buffer))
    {
        // If we get here, the JPEG code has signaled an error.
        throw std::runtime_error(Formatter() << "Error while decoding the JPEG image: " << this->decodingMessage());
    }

    static_assert(sizeof(JSAMPLE) == sizeof(uint8_t), "JSAMPLE is not 8bits, which is unsupported");

    // set parameters for decompression
    cinfo.dct_method = JDCT_ISLOW;
    cinfo.dither_mode = JDITHER_FS;
    cinfo.do_fancy_upsampling = true;
    cinfo.enable_2pass_quant = false;
    cinfo.do_block_smoothing = false;

    this->setDecodingMessage("Starting the JPEG decompressor");

    if (jpeg_start_decompress(&cinfo) == false)
    {
        qWarning() << "I/O suspension after jpeg_start_decompress()";
    }

    if(cinfo.output_components != 4)
    {
        throw std::runtime_error(Formatter() << "Unsupported number of pixel color components: " << cinfo.output_components);
    }

    image = this->allocateImageBuffer(cinfo.output_width, cinfo.output_height, QImage::Format_RGBA8888);
    auto* dataPtrBackup = image.constBits();

    bufferSetup.resize(image.height());
    for (JDIMENSION i = 0; i < bufferSetup.size(); i++)
    {
        bufferSetup[i] = const_cast<JSAMPLE*>(image.constScanLine(i));
    }

    this->setDecodingMessage("Consuming and decoding JPEG input file");

    while (cinfo.output_scanline < cinfo.output_height)
    {
        auto linesRead = jpeg_read_scanlines(&cinfo, &bufferSetup[cinfo.output_scanline], cinfo.rec_outbuf_height);
        if(linesRead == 0)
        {
            throw std::runtime_error(Formatter() << "Premature end of JPEG data at scanline " << cinfo.output_scanline);
        }
    }

    jpeg_finish_decompress(&cinfo);

    Q_ASSERT(image.constBits() == dataPtrBackup);

    this->convertColorSpace(image);

    this->setDecodingMessage("JPEG decoding completed successfully.");

    DecodedFrame frame;
    frame.image = std::move(image);
    return { std::move(frame) };
}

void SmartJpegDecoder::close()
{
    d->destroy();

    SmartImageDecoder::close();
}
